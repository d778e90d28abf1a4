#include "formtext/TableProcessor.hpp"

#include "formtext/TextUtils.hpp"
#include "formtext/WidgetOverlay.hpp"

#include <algorithm>
#include <sstream>

namespace formtext {

namespace {

struct CellElementText {
  RenderMode mode;

  std::string operator()(const Span &span) const { return span.text; }
  std::string operator()(WidgetRef widget) const {
    return displayValue(*widget, mode);
  }
};

std::string gridBorder(const std::vector<std::size_t> &widths, char fill) {
  std::string border = "+";
  for (std::size_t width : widths) {
    border += std::string(width + 2, fill);
    border += "+";
  }
  return border;
}

std::string gridRow(const std::vector<std::string> &values,
                    const std::vector<std::size_t> &widths) {
  std::string row = "|";
  for (std::size_t i = 0; i < widths.size(); i++) {
    const std::string &value = values[i];
    row += " " + value;
    row += std::string(widths[i] - text::codePointLength(value), ' ');
    row += " |";
  }
  return row;
}

std::string joinWith(const std::vector<std::string> &values,
                     const std::string &separator) {
  std::string result;
  for (std::size_t i = 0; i < values.size(); i++) {
    if (i > 0)
      result += separator;
    result += values[i];
  }
  return result;
}

} // anonymous namespace

TableProcessor::TableProcessor(double tolerance) : m_tolerance(tolerance) {}

bool TableProcessor::insideTable(const Line &line,
                                 const TableStructure &structure) const {
  return geometry::rectInside(structure.bbox, line.rect(), m_tolerance);
}

bool TableProcessor::insideAnyTable(
    const Line &line, const std::vector<TableStructure> &structures) const {
  return std::any_of(
      structures.begin(), structures.end(),
      [&](const TableStructure &s) { return insideTable(line, s); });
}

bool TableProcessor::repeatsHeader(const Line &line,
                                   const TableStructure &structure) const {
  for (const auto &cell : structure.header.cells) {
    if (geometry::rectInside(cell, line.rect(), m_tolerance) ||
        geometry::partiallyInside(cell, line.rect())) {
      return true;
    }
  }
  return false;
}

std::vector<Line>
TableProcessor::findTableLines(const std::vector<Line> &lines,
                               const std::vector<TableStructure> &structures)
    const {
  std::vector<Line> tableLines;
  for (const auto &line : lines) {
    if (insideAnyTable(line, structures)) {
      tableLines.push_back(line);
    }
  }
  return tableLines;
}

TableDetectionResult
TableProcessor::process(const std::vector<Line> &lines,
                        const std::vector<TableStructure> &structures) const {
  TableDetectionResult result;

  if (structures.empty()) {
    result.plainLines = lines;
    return result;
  }

  const std::vector<Line> tableLines = findTableLines(lines, structures);
  for (const auto &line : lines) {
    if (!insideAnyTable(line, structures)) {
      result.plainLines.push_back(line);
    }
  }

  for (const auto &line : tableLines) {
    for (const auto &element : line.elements()) {
      if (const WidgetRef *widget = std::get_if<WidgetRef>(&element)) {
        result.tableWidgets.push_back(*widget);
      }
    }
  }

  result.tables.reserve(structures.size());
  for (const auto &structure : structures) {
    result.tables.push_back(parseTable(tableLines, structure));
  }

  return result;
}

std::vector<TableColumn>
TableProcessor::columns(const TableStructure &structure) {
  std::vector<TableColumn> result;
  result.reserve(structure.header.cells.size());
  for (std::size_t i = 0; i < structure.header.cells.size(); i++) {
    TableColumn column;
    column.cell = structure.header.cells[i];
    if (i < structure.header.names.size()) {
      column.name = structure.header.names[i];
    }
    result.push_back(column);
  }
  return result;
}

Table TableProcessor::parseTable(const std::vector<Line> &tableLines,
                                 const TableStructure &structure) const {
  const auto tableColumns = columns(structure);

  Table table;
  table.rect = structure.bbox;
  for (const auto &column : tableColumns) {
    table.headerNames.push_back(column.name);
    table.headerCells.push_back(column.cell);
  }

  for (const auto &line : tableLines) {
    if (!insideTable(line, structure) || repeatsHeader(line, structure))
      continue;

    TableRow row;
    row.reserve(tableColumns.size());
    for (const auto &column : tableColumns) {
      TableCell cell;
      for (const auto &element : line.elements()) {
        if (geometry::wordInColumn(elementRect(element), column.cell)) {
          cell.push_back(element);
        }
      }
      row.push_back(std::move(cell));
    }
    table.rows.push_back(std::move(row));
  }

  return table;
}

std::string TableProcessor::cellText(const TableCell &cell, RenderMode mode) {
  std::vector<std::string> words;
  words.reserve(cell.size());
  for (const auto &element : cell) {
    words.push_back(std::visit(CellElementText{mode}, element));
  }
  return text::joinNonEmpty(words, " ");
}

std::string TableProcessor::formatGrid(const Table &table) {
  const std::size_t columnCount = table.headerCells.size();
  if (columnCount == 0) {
    return "";
  }

  std::vector<std::string> header(columnCount);
  for (std::size_t i = 0; i < columnCount && i < table.headerNames.size();
       i++) {
    header[i] = table.headerNames[i];
  }

  std::vector<std::vector<std::string>> body;
  for (const auto &row : table.rows) {
    std::vector<std::string> values(columnCount);
    bool hasText = false;
    for (std::size_t i = 0; i < columnCount && i < row.size(); i++) {
      values[i] = cellText(row[i], RenderMode::Plain);
      hasText = hasText || !values[i].empty();
    }
    if (hasText) {
      body.push_back(std::move(values));
    }
  }

  std::vector<std::size_t> widths(columnCount, 0);
  for (std::size_t i = 0; i < columnCount; i++) {
    widths[i] = text::codePointLength(header[i]);
    for (const auto &values : body) {
      widths[i] = std::max(widths[i], text::codePointLength(values[i]));
    }
  }

  std::ostringstream out;
  out << gridBorder(widths, '-') << "\n";
  out << gridRow(header, widths) << "\n";
  out << gridBorder(widths, '=');
  for (const auto &values : body) {
    out << "\n" << gridRow(values, widths);
    out << "\n" << gridBorder(widths, '-');
  }
  return out.str();
}

std::string TableProcessor::formatLabeled(const Table &table) {
  const std::size_t columnCount = table.headerCells.size();
  if (columnCount == 0) {
    return "";
  }

  std::vector<std::string> header(columnCount);
  for (std::size_t i = 0; i < columnCount && i < table.headerNames.size();
       i++) {
    header[i] = table.headerNames[i];
  }

  const std::string headerLine = joinWith(header, " | ");
  std::vector<std::string> lines;
  lines.push_back(headerLine);
  lines.push_back(std::string(text::codePointLength(headerLine) + 5, '-'));

  for (const auto &row : table.rows) {
    std::vector<std::string> values(columnCount, "N/A");
    for (std::size_t i = 0; i < columnCount && i < row.size(); i++) {
      std::string value = cellText(row[i], RenderMode::LabelAnnotated);
      if (!value.empty()) {
        values[i] = value;
      }
    }
    lines.push_back(joinWith(values, " | "));
  }

  return joinWith(lines, "\n");
}

std::string TableProcessor::format(const Table &table, RenderMode mode) {
  switch (mode) {
  case RenderMode::LabelAnnotated:
    return formatLabeled(table);
  case RenderMode::Plain:
    break;
  }
  return formatGrid(table);
}

} // namespace formtext
