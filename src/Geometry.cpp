#include "formtext/Geometry.hpp"

#include <algorithm>
#include <cmath>

namespace formtext {

namespace {

struct ElementRect {
  const Rect &operator()(const Span &span) const { return span.rect; }
  const Rect &operator()(WidgetRef widget) const { return widget->rect; }
};

} // anonymous namespace

const Rect &elementRect(const Element &element) {
  return std::visit(ElementRect{}, element);
}

namespace geometry {

Rect makeRect(double x0, double y0, double x1, double y1) {
  return Rect(x0, y0, x1 - x0, y1 - y0);
}

bool sameLine(const Rect &a, const Rect &b, double tolerance) {
  return std::abs(top(a) - top(b)) < tolerance ||
         std::abs(bottom(a) - bottom(b)) < tolerance;
}

bool rectInside(const Rect &outer, const Rect &inner, double tolerance) {
  const double minX = left(outer) - tolerance;
  const double maxX = right(outer) + tolerance;
  const double minY = top(outer) - tolerance;
  const double maxY = bottom(outer) + tolerance;

  return minX <= left(inner) && left(inner) <= maxX && minY <= top(inner) &&
         top(inner) <= maxY && minX <= right(inner) && right(inner) <= maxX &&
         minY <= bottom(inner) && bottom(inner) <= maxY;
}

bool partiallyInside(const Rect &outer, const Rect &inner) {
  return left(outer) <= left(inner) && right(outer) >= right(inner) &&
         bottom(outer) >= bottom(inner);
}

bool wordInColumn(const Rect &word, const Rect &column) {
  return left(column) <= left(word) && left(word) <= right(column);
}

std::optional<Rect> intersection(const Rect &a, const Rect &b) {
  // cv::Rect_ & yields an empty rect unless both extents are positive
  Rect overlap = a & b;
  if (overlap.empty()) {
    return std::nullopt;
  }
  return overlap;
}

Rect unite(const Rect &a, const Rect &b) {
  return makeRect(std::min(left(a), left(b)), std::min(top(a), top(b)),
                  std::max(right(a), right(b)), std::max(bottom(a), bottom(b)));
}

} // namespace geometry
} // namespace formtext
