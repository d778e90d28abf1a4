#ifndef FORMTEXT_LINE_BUILDER_HPP
#define FORMTEXT_LINE_BUILDER_HPP

#include "formtext/Geometry.hpp"
#include "formtext/Types.hpp"

#include <vector>

namespace formtext {

/**
 * @brief Lines of one page plus the spans removed while building them
 */
struct LineGroupingResult {
  std::vector<Line> lines;        ///< Lines ordered top to bottom
  std::vector<Span> droppedSpans; ///< Text duplicating a widget's value
};

/**
 * @brief Groups the spans and widgets of a page into reading-order lines
 *
 * Elements are sorted by their top edge and scanned once. The first element
 * of a line seeds it; every following element that is on the same line as
 * the seed joins it, anything else starts a new line. The seed is not
 * updated as the line grows. Finished lines are ordered left to right.
 *
 * Example usage:
 * @code
 * formtext::LineBuilder builder;
 * auto grouped = builder.build(formtext::LineBuilder::collectElements(page));
 * for (const auto &line : grouped.lines) { ... }
 * @endcode
 */
class LineBuilder {
public:
  explicit LineBuilder(double tolerance = geometry::kDefaultTolerance);

  /**
   * @brief Group elements into lines
   * @param elements Spans and widgets of one page, in any order
   * @return Lines ordered by the top edge of their seed element
   */
  LineGroupingResult build(std::vector<Element> elements) const;

  /**
   * @brief Gather the spans and widgets of a scraped page as elements
   *
   * Widget elements point into page, which must outlive the result.
   */
  static std::vector<Element> collectElements(const ScrapedPage &page);

  double tolerance() const { return m_tolerance; }

private:
  /**
   * @brief Finish a line: drop text that repeats a widget value, then order
   * the members left to right
   */
  Line closeLine(std::vector<Element> members, const Rect &seed,
                 std::vector<Span> &droppedSpans) const;

  double m_tolerance; ///< Same-line tolerance in points
};

} // namespace formtext

#endif // FORMTEXT_LINE_BUILDER_HPP
