#ifndef FORMTEXT_TYPES_HPP
#define FORMTEXT_TYPES_HPP

#include <opencv2/core.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace formtext {

/**
 * @brief Axis-aligned rectangle in page points
 *
 * Origin is the top-left corner of the page, y grows downward. The edges are
 * x0 = x, y0 = y, x1 = x + width, y1 = y + height. Callers guarantee
 * non-negative width and height.
 */
using Rect = cv::Rect2d;

/**
 * @brief A run of extracted text with its bounding box
 */
struct Span {
  std::string text; ///< UTF-8 text content
  Rect rect;        ///< Bounding box on the page
};

/**
 * @brief Kind of an interactive form field
 */
enum class FieldType {
  Text,     ///< Single or multi-line text input
  ComboBox, ///< Drop-down choice
  CheckBox, ///< Two-state check button
  Other     ///< Push buttons, radio groups, signatures, ...
};

/**
 * @brief Interactive form field as seen by the layout pipeline
 */
struct Widget {
  std::string fieldName;                 ///< Fully qualified field name
  FieldType fieldType = FieldType::Other; ///< Field kind
  std::optional<std::string> fieldValue; ///< Current value, if any
  Rect rect;                             ///< Widget rectangle on the page
};

/// Non-owning reference to a widget held by a ScrapedPage.
using WidgetRef = const Widget *;

/// A line member: either a text span or a form widget.
using Element = std::variant<Span, WidgetRef>;

/**
 * @brief Returns the bounding rectangle of a line element
 */
const Rect &elementRect(const Element &element);

/**
 * @brief Horizontally ordered group of elements sharing a vertical band
 *
 * The rectangle is the rectangle of the element that seeded the line and is
 * only used for vertical placement. A Line is never modified once built.
 */
class Line {
public:
  Line(std::vector<Element> elements, const Rect &rect)
      : m_elements(std::move(elements)), m_rect(rect) {}

  const std::vector<Element> &elements() const { return m_elements; }
  const Rect &rect() const { return m_rect; }

private:
  std::vector<Element> m_elements;
  Rect m_rect;
};

/**
 * @brief Header row of an externally detected table
 */
struct TableHeader {
  std::vector<Rect> cells;        ///< One rectangle per column, left to right
  std::vector<std::string> names; ///< Column titles, parallel to cells
};

/**
 * @brief Table bounding structure produced by the extraction layer
 */
struct TableStructure {
  Rect bbox;          ///< Outer bounds of the table
  TableHeader header; ///< Header cells and names
};

/**
 * @brief A column slot derived from one header cell
 */
struct TableColumn {
  Rect cell;        ///< Horizontal extent of the column
  std::string name; ///< Column title
};

using TableCell = std::vector<Element>;
using TableRow = std::vector<TableCell>;

/**
 * @brief Table segmented into rows and columns
 */
struct Table {
  std::vector<std::string> headerNames; ///< Column titles
  std::vector<Rect> headerCells;        ///< Column rectangles
  std::vector<TableRow> rows;           ///< Body rows, one cell per column
  Rect rect;                            ///< Outer bounds
};

/**
 * @brief Reconstructed content of one page
 */
struct Page {
  int number = 0;                 ///< 1-indexed page number
  std::vector<Line> lines;        ///< Lines outside of tables
  std::vector<WidgetRef> widgets; ///< All widgets of the page
  std::vector<Table> tables;      ///< Segmented tables
};

/**
 * @brief Reconstructed document
 *
 * Holds WidgetRef pointers into the ScrapedPage values it was built from, so
 * it must not outlive them.
 */
struct Document {
  std::vector<Page> pages;
};

/**
 * @brief Primitives extracted from one page of the source document
 */
struct ScrapedPage {
  std::vector<Span> spans;             ///< Text runs, unordered
  std::vector<Widget> widgets;         ///< Form widgets
  std::vector<TableStructure> tables;  ///< Detected table structures
};

/**
 * @brief How widget values are written into the output text
 */
enum class RenderMode {
  Plain,         ///< Bare values ("Jane", "N/A", "ON")
  LabelAnnotated ///< Values prefixed with the field name ("name: Jane")
};

using FieldMap = std::map<std::string, std::string>;

/**
 * @brief Text-field values split by where the widget was found
 */
struct FieldValues {
  FieldMap text;  ///< Free-standing fields ("Text" bucket)
  FieldMap table; ///< Fields inside a detected table ("Table" bucket)
};

/**
 * @brief Tunables of the layout pipeline
 */
struct ParserConfig {
  double lineTolerance = 5.0;    ///< Max baseline jitter within one line
  double containTolerance = 5.0; ///< Slack for table membership tests
  RenderMode renderMode = RenderMode::Plain; ///< Widget value rendering
  int overlayToleranceBefore = 2; ///< Characters kept before a widget
  int overlayToleranceAfter = 1;  ///< Characters dropped after a widget
  bool verbose = false;           ///< Print DEBUG output to stderr
};

} // namespace formtext

#endif // FORMTEXT_TYPES_HPP
