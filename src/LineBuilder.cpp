#include "formtext/LineBuilder.hpp"

#include <algorithm>
#include <set>
#include <string>

namespace formtext {

LineBuilder::LineBuilder(double tolerance) : m_tolerance(tolerance) {}

std::vector<Element> LineBuilder::collectElements(const ScrapedPage &page) {
  std::vector<Element> elements;
  elements.reserve(page.spans.size() + page.widgets.size());

  for (const auto &span : page.spans) {
    elements.emplace_back(span);
  }
  for (const auto &widget : page.widgets) {
    elements.emplace_back(&widget);
  }

  return elements;
}

LineGroupingResult LineBuilder::build(std::vector<Element> elements) const {
  LineGroupingResult result;
  if (elements.empty()) {
    return result;
  }

  std::stable_sort(elements.begin(), elements.end(),
                   [](const Element &a, const Element &b) {
                     return geometry::top(elementRect(a)) <
                            geometry::top(elementRect(b));
                   });

  std::vector<Element> members;
  Rect seed = elementRect(elements.front());

  for (auto &element : elements) {
    const Rect rect = elementRect(element);
    if (geometry::sameLine(seed, rect, m_tolerance)) {
      members.push_back(std::move(element));
    } else {
      result.lines.push_back(
          closeLine(std::move(members), seed, result.droppedSpans));
      members.clear();
      members.push_back(std::move(element));
      seed = rect;
    }
  }

  if (!members.empty()) {
    result.lines.push_back(
        closeLine(std::move(members), seed, result.droppedSpans));
  }

  return result;
}

Line LineBuilder::closeLine(std::vector<Element> members, const Rect &seed,
                            std::vector<Span> &droppedSpans) const {
  std::set<std::string> widgetValues;
  for (const auto &member : members) {
    if (const WidgetRef *widget = std::get_if<WidgetRef>(&member)) {
      const auto &value = (*widget)->fieldValue;
      if (value && !value->empty()) {
        widgetValues.insert(*value);
      }
    }
  }

  std::vector<Element> kept;
  kept.reserve(members.size());
  for (auto &member : members) {
    const Span *span = std::get_if<Span>(&member);
    if (span && widgetValues.count(span->text) > 0) {
      droppedSpans.push_back(*span);
      continue;
    }
    kept.push_back(std::move(member));
  }

  std::stable_sort(kept.begin(), kept.end(),
                   [](const Element &a, const Element &b) {
                     return geometry::left(elementRect(a)) <
                            geometry::left(elementRect(b));
                   });

  return Line(std::move(kept), seed);
}

} // namespace formtext
