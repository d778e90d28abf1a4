#include "formtext/DocumentParser.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <set>

namespace formtext {

namespace {

std::string fieldValueOf(const Widget &widget) {
  return widget.fieldValue ? *widget.fieldValue : std::string();
}

} // anonymous namespace

DocumentParser::DocumentParser() : DocumentParser(ParserConfig()) {}

DocumentParser::DocumentParser(const ParserConfig &config)
    : m_config(config), m_lineBuilder(config.lineTolerance),
      m_tableProcessor(config.containTolerance), m_formatter(config) {}

const ParserConfig &DocumentParser::getConfig() const { return m_config; }

void DocumentParser::setConfig(const ParserConfig &config) {
  m_config = config;
  m_lineBuilder = LineBuilder(config.lineTolerance);
  m_tableProcessor = TableProcessor(config.containTolerance);
  m_formatter = PageFormatter(config);
}

std::optional<PageParse>
DocumentParser::parsePage(const ScrapedPage &scraped, int pageNumber) const {
  if (scraped.spans.empty() && scraped.widgets.empty()) {
    if (m_config.verbose) {
      std::cerr << "DEBUG: Page " << pageNumber << " is empty, skipping"
                << std::endl;
    }
    return std::nullopt;
  }

  LineGroupingResult grouped =
      m_lineBuilder.build(LineBuilder::collectElements(scraped));

  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << pageNumber << ": " << scraped.spans.size()
              << " spans, " << scraped.widgets.size() << " widgets -> "
              << grouped.lines.size() << " lines ("
              << grouped.droppedSpans.size() << " duplicate spans dropped)"
              << std::endl;
  }

  TableDetectionResult detected =
      m_tableProcessor.process(grouped.lines, scraped.tables);

  if (m_config.verbose && !scraped.tables.empty()) {
    std::cerr << "DEBUG: Page " << pageNumber << ": "
              << detected.tables.size() << " tables, "
              << (grouped.lines.size() - detected.plainLines.size())
              << " lines moved into tables" << std::endl;
  }

  PageParse parsed;
  parsed.page.number = pageNumber;
  parsed.page.lines = std::move(detected.plainLines);
  parsed.page.tables = std::move(detected.tables);
  for (const auto &widget : scraped.widgets) {
    parsed.page.widgets.push_back(&widget);
  }

  const std::set<WidgetRef> inTable(detected.tableWidgets.begin(),
                                    detected.tableWidgets.end());
  for (WidgetRef widget : parsed.page.widgets) {
    if (widget->fieldType != FieldType::Text)
      continue;
    if (inTable.count(widget) > 0) {
      parsed.fieldValues.table[widget->fieldName] = fieldValueOf(*widget);
    } else {
      parsed.fieldValues.text[widget->fieldName] = fieldValueOf(*widget);
    }
  }

  parsed.text = m_formatter.formatPage(parsed.page);
  return parsed;
}

ParseResult DocumentParser::parse(const std::vector<ScrapedPage> &pages) const {
  ParseResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  for (std::size_t i = 0; i < pages.size(); i++) {
    const int pageNumber = static_cast<int>(i) + 1;
    try {
      std::optional<PageParse> parsed = parsePage(pages[i], pageNumber);
      if (!parsed) {
        continue;
      }

      result.documentText += parsed->text;
      mergeFieldValues(result.fieldValues, parsed->fieldValues);
      result.document.pages.push_back(std::move(parsed->page));
    } catch (const std::exception &e) {
      std::string message =
          "Page " + std::to_string(pageNumber) + ": " + e.what();
      std::cerr << "DEBUG: Exception processing page " << pageNumber << ": "
                << e.what() << std::endl;
      result.pageErrors.push_back(message);
    }
  }

  // A field that shows up in a table anywhere belongs to the table bucket
  for (const auto &entry : result.fieldValues.table) {
    result.fieldValues.text.erase(entry.first);
  }

  result.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (m_config.verbose) {
    std::cerr << "DEBUG: Assembled " << result.document.pages.size() << " of "
              << pages.size() << " pages in " << result.processingTimeMs
              << " ms" << std::endl;
  }

  return result;
}

FieldValues
DocumentParser::collectFieldValues(const std::vector<ScrapedPage> &pages) {
  FieldValues values;
  for (const auto &page : pages) {
    for (const auto &widget : page.widgets) {
      if (widget.fieldType == FieldType::Text) {
        values.text[widget.fieldName] = fieldValueOf(widget);
      }
    }
  }
  return values;
}

void DocumentParser::mergeFieldValues(FieldValues &into,
                                      const FieldValues &from) {
  for (const auto &entry : from.text) {
    into.text[entry.first] = entry.second;
  }
  for (const auto &entry : from.table) {
    into.table[entry.first] = entry.second;
  }
}

} // namespace formtext
