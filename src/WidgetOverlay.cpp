#include "formtext/WidgetOverlay.hpp"

#include "formtext/Geometry.hpp"
#include "formtext/TextUtils.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <vector>

namespace formtext {

namespace {

// "Off" is the PDF name of the unchecked appearance state
bool isChecked(const Widget &widget) {
  return widget.fieldValue && !widget.fieldValue->empty() &&
         *widget.fieldValue != "Off";
}

struct ElementText {
  RenderMode mode;

  std::string operator()(const Span &span) const { return span.text; }
  std::string operator()(WidgetRef widget) const {
    return "[" + displayValue(*widget, mode) + "]";
  }
};

} // anonymous namespace

std::string displayValue(const Widget &widget, RenderMode mode) {
  std::string value;
  switch (widget.fieldType) {
  case FieldType::Text:
  case FieldType::ComboBox:
    value = (widget.fieldValue && !widget.fieldValue->empty())
                ? *widget.fieldValue
                : "N/A";
    break;
  case FieldType::CheckBox:
    value = isChecked(widget) ? "ON" : "OFF";
    break;
  case FieldType::Other:
    return "";
  }

  if (mode == RenderMode::LabelAnnotated) {
    return widget.fieldName + ": " + value;
  }
  return value;
}

WidgetOverlay::WidgetOverlay(RenderMode mode, int toleranceBefore,
                             int toleranceAfter)
    : m_mode(mode), m_toleranceBefore(toleranceBefore),
      m_toleranceAfter(toleranceAfter) {}

Span WidgetOverlay::splice(const Span &span, const Widget &widget) const {
  auto overlap = geometry::intersection(span.rect, widget.rect);
  if (!overlap) {
    return span;
  }

  const auto offsets = text::codePointOffsets(span.text);
  const long length = static_cast<long>(offsets.size()) - 1;
  const double spanLeft = geometry::left(span.rect);
  const double spanWidth = geometry::right(span.rect) - spanLeft;

  long start = 0;
  long end = length;
  if (spanWidth > 0) {
    start = static_cast<long>(std::floor((geometry::left(*overlap) - spanLeft) /
                                         spanWidth * length)) +
            m_toleranceBefore;
    end = static_cast<long>(std::floor((geometry::right(*overlap) - spanLeft) /
                                       spanWidth * length)) -
          m_toleranceAfter;
  }

  start = std::clamp(start, 0L, length);
  end = std::clamp(end, 0L, length);
  // Characters between end and start would otherwise be emitted twice
  end = std::max(end, start);

  std::string before = span.text.substr(0, offsets[start]);
  std::string after = span.text.substr(offsets[end]);

  Span result;
  result.text = text::removeUnderscores(before) + "[" +
                displayValue(widget, m_mode) + "]" +
                text::removeUnderscores(after);
  result.rect = span.rect;
  return result;
}

Line WidgetOverlay::apply(const Line &line) const {
  std::vector<const Span *> spans;
  std::vector<WidgetRef> widgets;
  for (const auto &element : line.elements()) {
    if (const Span *span = std::get_if<Span>(&element)) {
      spans.push_back(span);
    } else {
      widgets.push_back(std::get<WidgetRef>(element));
    }
  }

  std::vector<Element> updated;
  updated.reserve(line.elements().size());
  std::set<WidgetRef> consumed;

  for (const Span *span : spans) {
    bool modified = false;
    for (WidgetRef widget : widgets) {
      if (consumed.count(widget) > 0)
        continue;
      if (geometry::intersection(span->rect, widget->rect)) {
        updated.emplace_back(splice(*span, *widget));
        consumed.insert(widget);
        modified = true;
        break;
      }
    }
    if (!modified) {
      updated.emplace_back(*span);
    }
  }

  for (WidgetRef widget : widgets) {
    if (consumed.count(widget) == 0) {
      updated.emplace_back(widget);
    }
  }

  std::stable_sort(updated.begin(), updated.end(),
                   [](const Element &a, const Element &b) {
                     return geometry::left(elementRect(a)) <
                            geometry::left(elementRect(b));
                   });

  return Line(std::move(updated), line.rect());
}

std::string WidgetOverlay::render(const Line &line) const {
  Line merged = apply(line);

  std::string result;
  const auto &elements = merged.elements();
  for (std::size_t i = 0; i < elements.size(); i++) {
    if (i > 0)
      result += " ";
    result += std::visit(ElementText{m_mode}, elements[i]);
  }
  return result;
}

} // namespace formtext
