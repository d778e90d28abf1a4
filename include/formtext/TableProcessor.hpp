#ifndef FORMTEXT_TABLE_PROCESSOR_HPP
#define FORMTEXT_TABLE_PROCESSOR_HPP

#include "formtext/Geometry.hpp"
#include "formtext/Types.hpp"

#include <string>
#include <vector>

namespace formtext {

/**
 * @brief Lines of a page split into flowing text and tables
 */
struct TableDetectionResult {
  std::vector<Line> plainLines;   ///< Lines outside every table
  std::vector<Table> tables;      ///< One entry per table structure
  std::vector<WidgetRef> tableWidgets; ///< Widgets found in table lines
};

/**
 * @brief Detects which lines belong to tables and segments them into columns
 *
 * Table structures come from the extraction layer. A line belongs to a table
 * when its rectangle lies within the table bounds. Member lines that repeat
 * the header row are discarded, the rest become rows whose elements are
 * assigned to the column whose header cell contains the element's left edge.
 * Columns may overlap; an element is then placed in every matching column.
 */
class TableProcessor {
public:
  explicit TableProcessor(double tolerance = geometry::kDefaultTolerance);

  /**
   * @brief Separate table lines from plain lines and parse every table
   * @param lines Lines of one page, top to bottom
   * @param structures Table structures of the same page
   */
  TableDetectionResult process(const std::vector<Line> &lines,
                               const std::vector<TableStructure> &structures)
      const;

  /**
   * @brief Lines lying within any of the given tables
   */
  std::vector<Line>
  findTableLines(const std::vector<Line> &lines,
                 const std::vector<TableStructure> &structures) const;

  /**
   * @brief Build one table from the table lines of its page
   *
   * Only the lines inside structure.bbox are used.
   */
  Table parseTable(const std::vector<Line> &tableLines,
                   const TableStructure &structure) const;

  /**
   * @brief Pair header cells with their names
   *
   * A cell without a name gets an empty name.
   */
  static std::vector<TableColumn> columns(const TableStructure &structure);

  /**
   * @brief Space-joined text of a cell, empty when nothing is in it
   *
   * Widgets contribute their display value for the given mode.
   */
  static std::string cellText(const TableCell &cell, RenderMode mode);

  /**
   * @brief Render a table as a bordered grid with a header row
   *
   * Rows without any text are skipped. A table without columns renders as
   * an empty string.
   */
  static std::string formatGrid(const Table &table);

  /**
   * @brief Render a table as "a | b" lines with field names on widget values
   *
   * Empty cells read "N/A". A table without columns renders as an empty
   * string.
   */
  static std::string formatLabeled(const Table &table);

  /**
   * @brief Render with formatGrid or formatLabeled depending on mode
   */
  static std::string format(const Table &table, RenderMode mode);

private:
  bool insideTable(const Line &line, const TableStructure &structure) const;
  bool insideAnyTable(const Line &line,
                      const std::vector<TableStructure> &structures) const;
  bool repeatsHeader(const Line &line, const TableStructure &structure) const;

  double m_tolerance; ///< Containment slack in points
};

} // namespace formtext

#endif // FORMTEXT_TABLE_PROCESSOR_HPP
