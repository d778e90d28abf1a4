#ifndef FORMTEXT_LAYOUT_RENDERER_HPP
#define FORMTEXT_LAYOUT_RENDERER_HPP

#include "formtext/Types.hpp"

#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace formtext {

/**
 * @brief Result of writing layout overlay images
 */
struct LayoutRenderResult {
  bool success = false;                 ///< Whether all pages were written
  std::string errorMessage;             ///< Error message if failed
  std::vector<std::string> outputPaths; ///< PNG files written, in page order
  double processingTimeMs = 0;          ///< Processing time in milliseconds
};

/**
 * @brief Draws the reconstructed layout of a parsed document on top of the
 * rendered PDF pages
 *
 * Colors (BGR): lines green, tables blue, header cells cyan, widgets red.
 */
class LayoutRenderer {
public:
  /**
   * @brief Render every parsed page with its layout boxes
   * @param pdfPath PDF the document was parsed from
   * @param document Parsed document; page numbers select the PDF pages
   * @param outputDir Directory for <stem>_page<N>_layout.png files
   * @param dpi Rendering resolution
   * @return LayoutRenderResult listing the written files
   */
  static LayoutRenderResult renderPages(const std::string &pdfPath,
                                        const Document &document,
                                        const std::string &outputDir,
                                        double dpi = 150.0);

  /**
   * @brief Draw the layout boxes of one page on a copy of an image
   * @param image Page raster (BGR or grayscale)
   * @param page Parsed page in points, top-left origin
   * @param scale Pixels per point
   * @return BGR image with the boxes drawn
   */
  static cv::Mat drawLayout(const cv::Mat &image, const Page &page,
                            double scale);
};

} // namespace formtext

#endif // FORMTEXT_LAYOUT_RENDERER_HPP
