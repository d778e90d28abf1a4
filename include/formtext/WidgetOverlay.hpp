#ifndef FORMTEXT_WIDGET_OVERLAY_HPP
#define FORMTEXT_WIDGET_OVERLAY_HPP

#include "formtext/Types.hpp"

#include <string>

namespace formtext {

/**
 * @brief Text shown for a widget's value
 *
 * Text and combo boxes show their value or "N/A", check boxes show "ON" or
 * "OFF", anything else shows nothing. In label-annotated mode non-empty
 * values are prefixed with "field_name: ".
 */
std::string displayValue(const Widget &widget, RenderMode mode);

/**
 * @brief Splices widget values into the text spans they overlap
 *
 * Widgets are drawn over underscore filler in most forms, so the extracted
 * text of a line contains "Name: ________" next to a widget holding the
 * actual value. The overlay replaces the covered characters with
 * "[value]" so the line reads "Name: [value]".
 */
class WidgetOverlay {
public:
  explicit WidgetOverlay(RenderMode mode = RenderMode::Plain,
                         int toleranceBefore = 2, int toleranceAfter = 1);

  /**
   * @brief Merge the widgets of a line into its spans
   *
   * Each span takes the first widget, in line order, whose rectangle
   * intersects it. A widget is used at most once; widgets that match no span
   * stay in the line as standalone elements. The result is ordered left to
   * right and keeps the rectangle of the input line.
   */
  Line apply(const Line &line) const;

  /**
   * @brief Apply the overlay and render the line as text
   *
   * Spans contribute their text, remaining widgets "[value]"; elements are
   * joined with single spaces.
   */
  std::string render(const Line &line) const;

  /**
   * @brief Replace the part of span covered by widget with "[value]"
   *
   * The covered horizontal extent is mapped linearly onto the span's
   * characters. Underscores around the inserted value are removed. A span
   * the widget does not intersect is returned unchanged.
   */
  Span splice(const Span &span, const Widget &widget) const;

  RenderMode mode() const { return m_mode; }

private:
  RenderMode m_mode;
  int m_toleranceBefore; ///< Extra characters kept before the value
  int m_toleranceAfter;  ///< Characters given back after the value
};

} // namespace formtext

#endif // FORMTEXT_WIDGET_OVERLAY_HPP
