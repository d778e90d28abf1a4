#ifndef FORMTEXT_DOCUMENT_PARSER_HPP
#define FORMTEXT_DOCUMENT_PARSER_HPP

#include "formtext/LineBuilder.hpp"
#include "formtext/PageFormatter.hpp"
#include "formtext/TableProcessor.hpp"
#include "formtext/Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace formtext {

/**
 * @brief Result of parsing a scraped document
 */
struct ParseResult {
  bool success = false;     ///< Whether parsing ran to completion
  std::string errorMessage; ///< Error message if failed

  std::string documentText; ///< Text of all pages in reading order
  FieldValues fieldValues;  ///< Text-field values by bucket
  Document document;        ///< Reconstructed pages (empty pages omitted)

  std::vector<std::string> pageErrors; ///< Failures of individual pages
  double processingTimeMs = 0;         ///< Processing time in milliseconds
};

/**
 * @brief Outcome of processing one page
 */
struct PageParse {
  Page page;               ///< Reconstructed page
  std::string text;        ///< Rendered page text
  FieldValues fieldValues; ///< Text-field values of this page only
};

/**
 * @brief Assembles scraped pages into document text and a field-value map
 *
 * Every page runs through line grouping, table detection and formatting on
 * its own. Partial results are merged in page order, so a failure on one
 * page does not affect the others.
 *
 * Example usage:
 * @code
 * formtext::PdfScraper scraper;
 * auto scraped = scraper.scrape("form.pdf");
 * formtext::DocumentParser parser;
 * auto result = parser.parse(scraped.pages);
 * std::cout << result.documentText;
 * @endcode
 */
class DocumentParser {
public:
  DocumentParser();
  explicit DocumentParser(const ParserConfig &config);

  /**
   * @brief Parse all pages of a document
   * @param pages Scraped pages in document order; page numbers are their
   * 1-based positions. The returned document points into pages, so
   * temporaries are rejected.
   */
  ParseResult parse(const std::vector<ScrapedPage> &pages) const;
  ParseResult parse(std::vector<ScrapedPage> &&pages) const = delete;

  /**
   * @brief Process one scraped page
   * @return Nothing for a page without spans and widgets
   */
  std::optional<PageParse> parsePage(const ScrapedPage &scraped,
                                     int pageNumber) const;
  std::optional<PageParse> parsePage(ScrapedPage &&scraped,
                                     int pageNumber) const = delete;

  /**
   * @brief Collect text-field values without any layout work
   *
   * All text widgets go into the "Text" bucket. Used when only the form
   * data is needed.
   */
  static FieldValues collectFieldValues(const std::vector<ScrapedPage> &pages);

  const ParserConfig &getConfig() const;

  /**
   * @brief Replace the configuration
   */
  void setConfig(const ParserConfig &config);

private:
  static void mergeFieldValues(FieldValues &into, const FieldValues &from);

  ParserConfig m_config;
  LineBuilder m_lineBuilder;
  TableProcessor m_tableProcessor;
  PageFormatter m_formatter;
};

} // namespace formtext

#endif // FORMTEXT_DOCUMENT_PARSER_HPP
