#include "formtext/DocumentParser.hpp"

#include "test_checks.hpp"

#include <type_traits>
#include <utility>
#include <vector>

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

Widget makeTextField(const std::string &name,
                     std::optional<std::string> value, double x0, double y0,
                     double x1, double y1) {
  Widget widget;
  widget.fieldName = name;
  widget.fieldType = FieldType::Text;
  widget.fieldValue = std::move(value);
  widget.rect = makeRect(x0, y0, x1, y1);
  return widget;
}

TableStructure nameAgeTable() {
  TableStructure structure;
  structure.bbox = makeRect(0, 100, 200, 160);
  structure.header.cells = {makeRect(0, 100, 100, 120),
                            makeRect(100, 100, 200, 120)};
  structure.header.names = {"Name", "Age"};
  return structure;
}

void testEmptyPage() {
  std::cout << "Empty page:" << std::endl;

  DocumentParser parser;
  ScrapedPage empty;
  // Tables alone do not make a page non-empty
  empty.tables.push_back(nameAgeTable());

  check(!parser.parsePage(empty, 1).has_value(), "no page parse");

  std::vector<ScrapedPage> pages = {empty};
  auto result = parser.parse(pages);
  check(result.success, "parse succeeds");
  check(result.document.pages.empty(), "no Page entry");
  checkEqual(result.documentText, "", "no text");
}

void testPageText() {
  std::cout << std::endl << "Page text layout:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Members", 0, 10, 60, 20));
  page.spans.push_back(makeSpan("Name", 5, 105, 40, 115));
  page.spans.push_back(makeSpan("Age", 105, 105, 130, 115));
  page.spans.push_back(makeSpan("Jane", 5, 130, 40, 140));
  page.spans.push_back(makeSpan("30", 105, 130, 120, 140));
  page.spans.push_back(makeSpan("Signature:", 0, 300, 70, 310));
  page.tables.push_back(nameAgeTable());

  DocumentParser parser;
  std::vector<ScrapedPage> pages = {page};
  auto result = parser.parse(pages);
  std::cout << result.documentText;

  checkEqual(result.documentText,
             "Page # 1\n"
             "\n"
             "Members\n"
             "+------+-----+\n"
             "| Name | Age |\n"
             "+======+=====+\n"
             "| Jane | 30  |\n"
             "+------+-----+\n"
             "Signature:\n",
             "lines and tables in vertical order");
  check(result.document.pages.size() == 1 &&
            result.document.pages[0].lines.size() == 2 &&
            result.document.pages[0].tables.size() == 1,
        "document holds two lines and one table");
}

void testFieldBuckets() {
  std::cout << std::endl << "Field buckets:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Applicant:", 0, 10, 60, 20));
  page.spans.push_back(makeSpan("Name", 5, 105, 40, 115));
  page.spans.push_back(makeSpan("Age", 105, 105, 130, 115));
  page.widgets.push_back(
      makeTextField("applicant", std::string("Jane Doe"), 70, 8, 200, 22));
  page.widgets.push_back(
      makeTextField("member_name", std::string("Jane"), 5, 130, 95, 140));
  page.widgets.push_back(
      makeTextField("member_age", std::nullopt, 105, 130, 195, 140));
  Widget box;
  box.fieldName = "agree";
  box.fieldType = FieldType::CheckBox;
  box.rect = makeRect(0, 200, 10, 210);
  page.widgets.push_back(box);
  page.tables.push_back(nameAgeTable());

  DocumentParser parser;
  std::vector<ScrapedPage> pages = {page};
  auto result = parser.parse(pages);
  std::cout << result.documentText;

  check(result.fieldValues.text.size() == 1 &&
            result.fieldValues.text.count("applicant") == 1,
        "free-standing field in the Text bucket");
  checkEqual(result.fieldValues.text["applicant"], "Jane Doe",
             "applicant value");
  check(result.fieldValues.table.size() == 2, "two fields in the Table bucket");
  checkEqual(result.fieldValues.table["member_name"], "Jane",
             "table field value");
  checkEqual(result.fieldValues.table["member_age"], "",
             "unfilled field maps to an empty string");
  check(result.fieldValues.text.count("agree") == 0 &&
            result.fieldValues.table.count("agree") == 0,
        "checkboxes are not in the field map");
  check(result.document.pages.size() == 1 &&
            result.document.pages[0].widgets.size() == 4,
        "page keeps every widget");

  std::cout << std::endl << "Table bucket wins across pages:" << std::endl;

  ScrapedPage first;
  first.spans.push_back(makeSpan("Name:", 0, 10, 40, 20));
  first.widgets.push_back(
      makeTextField("member_name", std::string("Jane"), 50, 8, 150, 22));

  std::vector<ScrapedPage> both = {first, page};
  auto merged = parser.parse(both);
  check(merged.fieldValues.text.count("member_name") == 0,
        "table field removed from the Text bucket");
  check(merged.fieldValues.table.count("member_name") == 1,
        "table field kept in the Table bucket");

  auto all = DocumentParser::collectFieldValues(both);
  check(all.text.size() == 3 && all.table.empty(),
        "collectFieldValues puts every text field in the Text bucket");
}

void testPageNumbering() {
  std::cout << std::endl << "Page numbering:" << std::endl;

  ScrapedPage one;
  one.spans.push_back(makeSpan("first", 0, 0, 30, 10));
  ScrapedPage three;
  three.spans.push_back(makeSpan("third", 0, 0, 30, 10));

  DocumentParser parser;
  std::vector<ScrapedPage> pages = {one, ScrapedPage(), three};
  auto result = parser.parse(pages);
  std::cout << result.documentText;

  checkEqual(result.documentText,
             "Page # 1\n\nfirst\nPage # 3\n\nthird\n",
             "empty page leaves a gap in the numbering");
  check(result.document.pages.size() == 2 &&
            result.document.pages[0].number == 1 &&
            result.document.pages[1].number == 3,
        "page numbers follow input positions");
  check(result.pageErrors.empty(), "no page errors");
}

void testLabelMode() {
  std::cout << std::endl << "Label-annotated mode:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Name: __________", 0, 0, 160, 10));
  page.widgets.push_back(
      makeTextField("applicant", std::string("Jane"), 60, 0, 160, 10));

  ParserConfig config;
  config.renderMode = RenderMode::LabelAnnotated;
  DocumentParser parser(config);
  std::vector<ScrapedPage> pages = {page};
  checkEqual(parser.parse(pages).documentText,
             "Page # 1\n\nName: [applicant: Jane]\n", "label in line text");

  config.renderMode = RenderMode::Plain;
  parser.setConfig(config);
  checkEqual(parser.parse(pages).documentText,
             "Page # 1\n\nName: [Jane]\n", "setConfig switches the mode");
}

// True when parse() can be called with an argument of type T
template <typename T, typename = void>
struct AcceptsPages : std::false_type {};
template <typename T>
struct AcceptsPages<T, std::void_t<decltype(std::declval<const DocumentParser &>()
                                                .parse(std::declval<T>()))>>
    : std::true_type {};

static_assert(AcceptsPages<std::vector<ScrapedPage> &>::value,
              "named page vectors are accepted");
static_assert(!AcceptsPages<std::vector<ScrapedPage>>::value,
              "temporary page vectors are rejected");

void testWidgetReferences() {
  std::cout << std::endl << "Widget references:" << std::endl;

  ScrapedPage page;
  page.spans.push_back(makeSpan("Name:", 0, 0, 40, 10));
  page.widgets.push_back(
      makeTextField("applicant", std::string("Jane"), 50, 0, 150, 10));
  std::vector<ScrapedPage> pages = {page};

  DocumentParser parser;
  auto result = parser.parse(pages);

  check(result.document.pages.size() == 1 &&
            result.document.pages[0].widgets.size() == 1,
        "one widget on the page");
  if (result.document.pages.size() == 1 &&
      result.document.pages[0].widgets.size() == 1) {
    WidgetRef widget = result.document.pages[0].widgets[0];
    check(widget == &pages[0].widgets[0],
          "page widgets point into the scraped pages");
    checkEqual(widget->fieldName, "applicant", "widget still readable");
  }
}

} // anonymous namespace

int main() {
  std::cout << "=== Test DocumentParser ===" << std::endl << std::endl;

  testEmptyPage();
  testPageText();
  testFieldBuckets();
  testPageNumbering();
  testLabelMode();
  testWidgetReferences();

  return finishTests();
}
