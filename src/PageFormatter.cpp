#include "formtext/PageFormatter.hpp"

#include "formtext/Geometry.hpp"
#include "formtext/TableProcessor.hpp"

#include <algorithm>
#include <vector>

namespace formtext {

namespace {

// A page item in reading order: either a line or a table
struct PageItem {
  double top;
  const Line *line;
  const Table *table;
};

} // anonymous namespace

PageFormatter::PageFormatter(const ParserConfig &config)
    : m_mode(config.renderMode),
      m_overlay(config.renderMode, config.overlayToleranceBefore,
                config.overlayToleranceAfter) {}

std::string PageFormatter::formatPage(const Page &page) const {
  std::vector<PageItem> items;
  items.reserve(page.lines.size() + page.tables.size());
  for (const auto &line : page.lines) {
    items.push_back({geometry::top(line.rect()), &line, nullptr});
  }
  for (const auto &table : page.tables) {
    items.push_back({geometry::top(table.rect), nullptr, &table});
  }

  std::stable_sort(
      items.begin(), items.end(),
      [](const PageItem &a, const PageItem &b) { return a.top < b.top; });

  std::string result = "Page # " + std::to_string(page.number) + "\n";
  for (const auto &item : items) {
    result += "\n";
    if (item.table) {
      result += TableProcessor::format(*item.table, m_mode);
    } else {
      result += m_overlay.render(*item.line);
    }
  }
  result += "\n";

  return result;
}

} // namespace formtext
