#ifndef FORMTEXT_PAGE_FORMATTER_HPP
#define FORMTEXT_PAGE_FORMATTER_HPP

#include "formtext/Types.hpp"
#include "formtext/WidgetOverlay.hpp"

#include <string>

namespace formtext {

/**
 * @brief Renders a reconstructed page as reading-order text
 *
 * Lines and tables are interleaved by the top edge of their rectangles.
 * Lines go through the widget overlay, tables through the table renderer of
 * the configured mode. The output starts with a "Page # N" header and each
 * item is on its own line.
 */
class PageFormatter {
public:
  explicit PageFormatter(const ParserConfig &config = ParserConfig());

  std::string formatPage(const Page &page) const;

private:
  RenderMode m_mode;
  WidgetOverlay m_overlay;
};

} // namespace formtext

#endif // FORMTEXT_PAGE_FORMATTER_HPP
