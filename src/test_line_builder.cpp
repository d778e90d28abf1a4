#include "formtext/LineBuilder.hpp"
#include "formtext/TableProcessor.hpp"

#include "test_checks.hpp"

#include <algorithm>
#include <iomanip>

using namespace formtext;
using geometry::makeRect;

namespace {

Span makeSpan(const std::string &text, double x0, double y0, double x1,
              double y1) {
  Span span;
  span.text = text;
  span.rect = makeRect(x0, y0, x1, y1);
  return span;
}

std::string lineText(const Line &line) {
  std::string result;
  for (const auto &element : line.elements()) {
    if (!result.empty())
      result += " ";
    if (const Span *span = std::get_if<Span>(&element)) {
      result += span->text;
    } else {
      result += "<" + std::get<WidgetRef>(element)->fieldName + ">";
    }
  }
  return result;
}

void printLines(const std::vector<Line> &lines) {
  for (std::size_t i = 0; i < lines.size(); i++) {
    std::cout << "    " << std::setw(2) << i << " (y=" << lines[i].rect().y
              << "): " << lineText(lines[i]) << std::endl;
  }
}

std::vector<std::string> spanTexts(const std::vector<Line> &lines) {
  std::vector<std::string> texts;
  for (const auto &line : lines) {
    for (const auto &element : line.elements()) {
      if (const Span *span = std::get_if<Span>(&element)) {
        texts.push_back(span->text);
      }
    }
  }
  return texts;
}

void testThreeLines() {
  std::cout << "Spans on three separate bands:" << std::endl;

  ScrapedPage page;
  // Added in random order
  page.spans.push_back(makeSpan("test", 250, 100, 280, 110));
  page.spans.push_back(makeSpan("Hello", 100, 0, 140, 10));
  page.spans.push_back(makeSpan("text", 250, 50, 280, 60));
  page.spans.push_back(makeSpan("World", 300, 0, 340, 10));
  page.spans.push_back(makeSpan("This", 50, 100, 80, 110));
  page.spans.push_back(makeSpan("Sorted", 100, 50, 150, 60));

  LineBuilder builder;
  auto result = builder.build(LineBuilder::collectElements(page));
  printLines(result.lines);

  check(result.lines.size() == 3, "three lines");
  if (result.lines.size() == 3) {
    checkEqual(lineText(result.lines[0]), "Hello World", "first line");
    checkEqual(lineText(result.lines[1]), "Sorted text", "second line");
    checkEqual(lineText(result.lines[2]), "This test", "third line");
  }

  bool ascending = std::is_sorted(
      result.lines.begin(), result.lines.end(),
      [](const Line &a, const Line &b) { return a.rect().y < b.rect().y; });
  check(ascending, "lines ordered by ascending top");
  check(result.droppedSpans.empty(), "nothing dropped");
}

void testSeedIsKept() {
  std::cout << std::endl << "Drifting baseline:" << std::endl;

  // Each span is within tolerance of its neighbour but the seed stays put
  ScrapedPage page;
  page.spans.push_back(makeSpan("a", 0, 100, 10, 110));
  page.spans.push_back(makeSpan("b", 20, 104, 30, 114));
  page.spans.push_back(makeSpan("c", 40, 108, 50, 118));

  LineBuilder builder;
  auto result = builder.build(LineBuilder::collectElements(page));
  printLines(result.lines);

  check(result.lines.size() == 2, "third span starts a new line");
  if (result.lines.size() == 2) {
    check(result.lines[0].rect() == page.spans[0].rect,
          "line rectangle is the seed rectangle");
    checkEqual(lineText(result.lines[0]), "a b", "first line holds a and b");
  }
}

void testWidgetDeduplication() {
  std::cout << std::endl << "Text duplicating a widget value:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Name:", 0, 20, 40, 30));
  page.spans.push_back(makeSpan("Jane", 60, 20, 90, 30));
  page.spans.push_back(makeSpan("Jane", 60, 200, 90, 210));

  Widget widget;
  widget.fieldName = "name";
  widget.fieldType = FieldType::Text;
  widget.fieldValue = "Jane";
  widget.rect = makeRect(50, 18, 150, 32);
  page.widgets.push_back(widget);

  LineBuilder builder;
  auto result = builder.build(LineBuilder::collectElements(page));
  printLines(result.lines);

  check(result.lines.size() == 2, "two lines");
  if (result.lines.size() == 2) {
    checkEqual(lineText(result.lines[0]), "Name: <name>",
               "span equal to the widget value is dropped");
    checkEqual(lineText(result.lines[1]), "Jane",
               "the same text on another line is kept");
  }
  check(result.droppedSpans.size() == 1, "one span dropped");
}

void testSpanConservation() {
  std::cout << std::endl << "Span conservation with a table:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Title", 0, 10, 50, 20));
  page.spans.push_back(makeSpan("Name", 5, 105, 40, 115));
  page.spans.push_back(makeSpan("Age", 105, 105, 130, 115));
  page.spans.push_back(makeSpan("Jane", 5, 130, 40, 140));
  page.spans.push_back(makeSpan("30", 105, 130, 120, 140));
  page.spans.push_back(makeSpan("Filled", 5, 200, 40, 210));

  Widget widget;
  widget.fieldName = "note";
  widget.fieldType = FieldType::Text;
  widget.fieldValue = "Filled";
  widget.rect = makeRect(0, 198, 100, 212);
  page.widgets.push_back(widget);

  TableStructure structure;
  structure.bbox = makeRect(0, 100, 200, 160);
  structure.header.cells = {makeRect(0, 100, 100, 120),
                            makeRect(100, 100, 200, 120)};
  structure.header.names = {"Name", "Age"};
  page.tables.push_back(structure);

  LineBuilder builder;
  auto grouped = builder.build(LineBuilder::collectElements(page));
  TableProcessor processor;
  auto detected = processor.process(grouped.lines, page.tables);

  std::vector<std::string> seen = spanTexts(detected.plainLines);
  std::vector<std::string> inTables =
      spanTexts(processor.findTableLines(grouped.lines, page.tables));
  seen.insert(seen.end(), inTables.begin(), inTables.end());
  for (const auto &span : grouped.droppedSpans) {
    seen.push_back(span.text);
  }

  std::vector<std::string> original;
  for (const auto &span : page.spans) {
    original.push_back(span.text);
  }

  std::sort(seen.begin(), seen.end());
  std::sort(original.begin(), original.end());
  check(seen == original, "plain + table + dropped spans == input spans");
}

} // anonymous namespace

int main() {
  std::cout << "=== Test LineBuilder ===" << std::endl << std::endl;

  testThreeLines();
  testSeedIsKept();
  testWidgetDeduplication();
  testSpanConservation();

  return finishTests();
}
