#ifndef FORMTEXT_GEOMETRY_HPP
#define FORMTEXT_GEOMETRY_HPP

#include "formtext/Types.hpp"

#include <optional>

namespace formtext {
namespace geometry {

constexpr double kDefaultTolerance = 5.0;

inline double left(const Rect &r) { return r.x; }
inline double top(const Rect &r) { return r.y; }
inline double right(const Rect &r) { return r.x + r.width; }
inline double bottom(const Rect &r) { return r.y + r.height; }

/**
 * @brief Build a rectangle from its edges
 */
Rect makeRect(double x0, double y0, double x1, double y1);

/**
 * @brief Check whether two rectangles sit on the same text line
 *
 * True when either the top edges or the bottom edges are closer than
 * tolerance.
 */
bool sameLine(const Rect &a, const Rect &b,
              double tolerance = kDefaultTolerance);

/**
 * @brief Check whether inner lies within outer grown by tolerance on every
 * side
 */
bool rectInside(const Rect &outer, const Rect &inner,
                double tolerance = kDefaultTolerance);

/**
 * @brief Check horizontal containment plus a bottom edge that does not pass
 * outer's bottom
 *
 * The top edge is not checked, so a row hanging below a header cell still
 * matches.
 */
bool partiallyInside(const Rect &outer, const Rect &inner);

/**
 * @brief Check whether a word starts within the column's horizontal extent
 */
bool wordInColumn(const Rect &word, const Rect &column);

/**
 * @brief Overlap of two rectangles
 * @return The overlap, or nothing when the rectangles do not overlap with a
 * positive extent on both axes
 */
std::optional<Rect> intersection(const Rect &a, const Rect &b);

/**
 * @brief Smallest rectangle containing both a and b
 */
Rect unite(const Rect &a, const Rect &b);

} // namespace geometry
} // namespace formtext

#endif // FORMTEXT_GEOMETRY_HPP
