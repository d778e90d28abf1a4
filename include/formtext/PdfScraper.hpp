#ifndef FORMTEXT_PDF_SCRAPER_HPP
#define FORMTEXT_PDF_SCRAPER_HPP

#include "formtext/Types.hpp"

#include <string>
#include <vector>

namespace formtext {

/**
 * @brief Configuration options for PDF primitive extraction
 */
struct ScraperConfig {
  double minCellSize = 5.0;       ///< Smallest table cell side in points
  double cellJoinTolerance = 2.0; ///< Max gap between cells of one table
  int minTableCells = 4;          ///< Fewer cells are not a table
  bool extractTables = true;      ///< Run table detection
  bool verbose = false;           ///< Print DEBUG output to stderr
};

/**
 * @brief Result of scraping a PDF file
 */
struct ScrapeResult {
  bool success = false;           ///< Whether the document could be read
  std::string errorMessage;       ///< Error message if failed
  std::vector<ScrapedPage> pages; ///< One entry per page, in order
  double processingTimeMs = 0;    ///< Processing time in milliseconds
};

/**
 * @brief Extracts positioned text, form widgets and table structures from a
 * PDF using Poppler
 *
 * Text comes from the poppler-cpp text list, widgets from the form API of
 * the Poppler core, tables from the rectangles drawn on the page. All
 * rectangles are in points with the origin at the top-left of the crop box.
 *
 * Example usage:
 * @code
 * formtext::PdfScraper scraper;
 * auto result = scraper.scrape("form.pdf");
 * if (result.success) {
 *     std::cout << result.pages.size() << " pages" << std::endl;
 * }
 * @endcode
 */
class PdfScraper {
public:
  PdfScraper();
  explicit PdfScraper(const ScraperConfig &config);

  /**
   * @brief Extract spans, widgets and tables of every page
   * @param pdfPath Path to the PDF file
   * @return ScrapeResult with one ScrapedPage per page. A page that fails to
   * extract is left empty so numbering is preserved.
   */
  ScrapeResult scrape(const std::string &pdfPath) const;

  /**
   * @brief Extract only the form widgets of every page
   * @param pdfPath Path to the PDF file
   */
  ScrapeResult scrapeWidgets(const std::string &pdfPath) const;

  /**
   * @brief Group cell rectangles into table structures
   *
   * Rectangles that touch (within cellJoinTolerance) form one group. Groups
   * with at least minTableCells cells over at least two rows become tables;
   * the top row supplies the header cells and the text of the spans inside
   * each header cell supplies the column names.
   *
   * @param cells Rectangles drawn on the page, top-left origin
   * @param spans Text of the same page
   * @param config Detection thresholds
   * @return Tables ordered top to bottom
   */
  static std::vector<TableStructure>
  detectTables(const std::vector<Rect> &cells, const std::vector<Span> &spans,
               const ScraperConfig &config);

  const ScraperConfig &getConfig() const;
  void setConfig(const ScraperConfig &config);

private:
  ScrapeResult scrapeDocument(const std::string &pdfPath,
                              bool widgetsOnly) const;

  ScraperConfig m_config;
};

} // namespace formtext

#endif // FORMTEXT_PDF_SCRAPER_HPP
