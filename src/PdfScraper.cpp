#include "formtext/PdfScraper.hpp"

#include "formtext/Geometry.hpp"
#include "formtext/TextUtils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <numeric>

// Poppler C++ wrapper for text extraction
#include <poppler-document.h>
#include <poppler-page.h>

// Poppler low-level API for form widgets and vector graphics
#include <Annot.h>
#include <Form.h>
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Page.h>
#include <UTF.h>
#include <goo/GooString.h>

namespace formtext {

namespace {

// Collects closed rectangular paths; coordinates are top-left based because
// the device is upside down
class CellExtractorOutputDev : public OutputDev {
public:
  explicit CellExtractorOutputDev(double minSz) : minSize(minSz) {}

  std::vector<Rect> &getCells() { return cells; }

  // Required OutputDev overrides
  bool upsideDown() override { return true; }
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; }

  void stroke(GfxState *state) override { extractCellsFromPath(state); }
  void fill(GfxState *state) override { extractCellsFromPath(state); }
  void eoFill(GfxState *state) override { extractCellsFromPath(state); }

private:
  void extractCellsFromPath(GfxState *state) {
    const GfxPath *path = state->getPath();
    if (!path)
      return;

    const auto &ctm = state->getCTM();

    for (int i = 0; i < path->getNumSubpaths(); i++) {
      const GfxSubpath *subpath = path->getSubpath(i);

      // 4 corners, possibly with an explicit closing point
      int numPoints = subpath->getNumPoints();
      if (numPoints < 4 || numPoints > 5)
        continue;
      if (!subpath->isClosed() && numPoints != 5)
        continue;

      bool hasCurves = false;
      for (int j = 0; j < numPoints; j++) {
        if (subpath->getCurve(j)) {
          hasCurves = true;
          break;
        }
      }
      if (hasCurves)
        continue;

      double x[4], y[4];
      for (int j = 0; j < 4; j++) {
        double px = subpath->getX(j);
        double py = subpath->getY(j);
        x[j] = ctm[0] * px + ctm[2] * py + ctm[4];
        y[j] = ctm[1] * px + ctm[3] * py + ctm[5];
      }

      if (!isAxisAligned(x, y))
        continue;

      double minX = std::min({x[0], x[1], x[2], x[3]});
      double maxX = std::max({x[0], x[1], x[2], x[3]});
      double minY = std::min({y[0], y[1], y[2], y[3]});
      double maxY = std::max({y[0], y[1], y[2], y[3]});

      if (maxX - minX < minSize || maxY - minY < minSize)
        continue;

      cells.push_back(geometry::makeRect(minX, minY, maxX, maxY));
    }
  }

  // Exactly two distinct x and two distinct y values
  static bool isAxisAligned(const double x[4], const double y[4]) {
    const double tolerance = 0.5;

    std::vector<double> xVals, yVals;
    for (int i = 0; i < 4; i++) {
      bool foundX = false, foundY = false;
      for (double xv : xVals) {
        if (std::abs(x[i] - xv) < tolerance) {
          foundX = true;
          break;
        }
      }
      for (double yv : yVals) {
        if (std::abs(y[i] - yv) < tolerance) {
          foundY = true;
          break;
        }
      }
      if (!foundX)
        xVals.push_back(x[i]);
      if (!foundY)
        yVals.push_back(y[i]);
    }

    return xVals.size() == 2 && yVals.size() == 2;
  }

  std::vector<Rect> cells;
  double minSize;
};

// Widget appearances are annotations; they are not table borders
bool skipAnnotations(Annot *, void *) { return false; }

std::string toUtf8(const GooString *text) {
  if (!text)
    return "";
  return TextStringToUtf8(text->toStr());
}

std::optional<std::string> selectedChoice(FormWidgetChoice &choice) {
  const GooString *edited = choice.getEditChoice();
  if (edited && edited->getLength() > 0) {
    return toUtf8(edited);
  }
  for (int i = 0; i < choice.getNumChoices(); i++) {
    if (choice.isSelected(i)) {
      return toUtf8(choice.getChoice(i));
    }
  }
  return std::nullopt;
}

std::vector<Span> extractSpans(poppler::page &page) {
  std::vector<Span> spans;

  // Text boxes are already in top-left page coordinates
  for (auto &textBox : page.text_list()) {
    poppler::byte_array textBytes = textBox.text().to_utf8();
    std::string text(textBytes.begin(), textBytes.end());

    bool blank = std::all_of(text.begin(), text.end(), [](char c) {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    if (blank)
      continue;

    poppler::rectf bbox = textBox.bbox();
    Span span;
    span.text = text;
    span.rect = Rect(bbox.x(), bbox.y(), bbox.width(), bbox.height());
    spans.push_back(span);
  }

  return spans;
}

std::vector<Widget> extractWidgets(::Page &page) {
  std::vector<Widget> widgets;

  auto formWidgets = page.getFormWidgets();
  if (!formWidgets)
    return widgets;

  const PDFRectangle *cropBox = page.getCropBox();

  for (int i = 0; i < formWidgets->getNumWidgets(); i++) {
    FormWidget *formWidget = formWidgets->getWidget(i);
    if (!formWidget)
      continue;

    Widget widget;
    widget.fieldName = toUtf8(formWidget->getFullyQualifiedName());

    // Annotation rectangles are in PDF user space, origin bottom-left
    double x1, y1, x2, y2;
    formWidget->getRect(&x1, &y1, &x2, &y2);
    widget.rect = geometry::makeRect(
        std::min(x1, x2) - cropBox->x1, cropBox->y2 - std::max(y1, y2),
        std::max(x1, x2) - cropBox->x1, cropBox->y2 - std::min(y1, y2));

    switch (formWidget->getType()) {
    case formText: {
      widget.fieldType = FieldType::Text;
      const GooString *content =
          static_cast<FormWidgetText *>(formWidget)->getContent();
      if (content && content->getLength() > 0) {
        widget.fieldValue = toUtf8(content);
      }
      break;
    }
    case formChoice: {
      auto *choice = static_cast<FormWidgetChoice *>(formWidget);
      widget.fieldType =
          choice->isCombo() ? FieldType::ComboBox : FieldType::Other;
      widget.fieldValue = selectedChoice(*choice);
      break;
    }
    case formButton: {
      auto *button = static_cast<FormWidgetButton *>(formWidget);
      if (button->getButtonType() == formButtonCheck) {
        widget.fieldType = FieldType::CheckBox;
        if (button->getState()) {
          const char *onState = button->getOnStr();
          widget.fieldValue = onState ? onState : "On";
        }
      }
      break;
    }
    default:
      break;
    }

    widgets.push_back(widget);
  }

  return widgets;
}

// Union-find over cell indices
std::size_t findRoot(std::vector<std::size_t> &parent, std::size_t i) {
  while (parent[i] != i) {
    parent[i] = parent[parent[i]];
    i = parent[i];
  }
  return i;
}

bool touches(const Rect &a, const Rect &b, double tolerance) {
  Rect grown(a.x - tolerance, a.y - tolerance, a.width + 2 * tolerance,
             a.height + 2 * tolerance);
  return geometry::intersection(grown, b).has_value();
}

bool sameRect(const Rect &a, const Rect &b) {
  const double tolerance = 0.5;
  return std::abs(geometry::left(a) - geometry::left(b)) < tolerance &&
         std::abs(geometry::top(a) - geometry::top(b)) < tolerance &&
         std::abs(geometry::right(a) - geometry::right(b)) < tolerance &&
         std::abs(geometry::bottom(a) - geometry::bottom(b)) < tolerance;
}

} // anonymous namespace

PdfScraper::PdfScraper() : m_config() {}

PdfScraper::PdfScraper(const ScraperConfig &config) : m_config(config) {}

const ScraperConfig &PdfScraper::getConfig() const { return m_config; }

void PdfScraper::setConfig(const ScraperConfig &config) { m_config = config; }

ScrapeResult PdfScraper::scrape(const std::string &pdfPath) const {
  return scrapeDocument(pdfPath, false);
}

ScrapeResult PdfScraper::scrapeWidgets(const std::string &pdfPath) const {
  return scrapeDocument(pdfPath, true);
}

std::vector<TableStructure>
PdfScraper::detectTables(const std::vector<Rect> &cells,
                         const std::vector<Span> &spans,
                         const ScraperConfig &config) {
  // The same cell is often both filled and stroked
  std::vector<Rect> unique;
  for (const auto &cell : cells) {
    bool duplicate = std::any_of(unique.begin(), unique.end(),
                                 [&](const Rect &u) { return sameRect(u, cell); });
    if (!duplicate)
      unique.push_back(cell);
  }

  // Frames around other rectangles are borders, not cells
  std::vector<Rect> candidates;
  for (std::size_t i = 0; i < unique.size(); i++) {
    bool frame = false;
    for (std::size_t j = 0; j < unique.size() && !frame; j++) {
      frame = i != j && unique[i].area() > unique[j].area() &&
              geometry::rectInside(unique[i], unique[j], 0.5);
    }
    if (!frame)
      candidates.push_back(unique[i]);
  }

  std::vector<std::size_t> parent(candidates.size());
  std::iota(parent.begin(), parent.end(), 0);
  for (std::size_t i = 0; i < candidates.size(); i++) {
    for (std::size_t j = i + 1; j < candidates.size(); j++) {
      if (touches(candidates[i], candidates[j], config.cellJoinTolerance)) {
        parent[findRoot(parent, i)] = findRoot(parent, j);
      }
    }
  }

  std::map<std::size_t, std::vector<Rect>> groups;
  for (std::size_t i = 0; i < candidates.size(); i++) {
    groups[findRoot(parent, i)].push_back(candidates[i]);
  }

  std::vector<TableStructure> tables;
  for (auto &entry : groups) {
    std::vector<Rect> &group = entry.second;
    if (static_cast<int>(group.size()) < config.minTableCells)
      continue;

    std::sort(group.begin(), group.end(), [](const Rect &a, const Rect &b) {
      return a.y < b.y || (a.y == b.y && a.x < b.x);
    });

    std::vector<double> rowTops;
    for (const auto &cell : group) {
      if (rowTops.empty() ||
          geometry::top(cell) - rowTops.back() > config.cellJoinTolerance) {
        rowTops.push_back(geometry::top(cell));
      }
    }
    if (rowTops.size() < 2)
      continue;

    TableStructure table;
    table.bbox = group.front();
    for (const auto &cell : group) {
      table.bbox = geometry::unite(table.bbox, cell);
    }

    std::vector<Rect> headerCells;
    for (const auto &cell : group) {
      if (geometry::top(cell) - rowTops.front() <= config.cellJoinTolerance) {
        headerCells.push_back(cell);
      }
    }
    std::sort(headerCells.begin(), headerCells.end(),
              [](const Rect &a, const Rect &b) { return a.x < b.x; });

    for (const auto &cell : headerCells) {
      std::vector<const Span *> inside;
      for (const auto &span : spans) {
        if (geometry::rectInside(cell, span.rect, config.cellJoinTolerance)) {
          inside.push_back(&span);
        }
      }
      std::stable_sort(inside.begin(), inside.end(),
                       [](const Span *a, const Span *b) {
                         return a->rect.y < b->rect.y ||
                                (a->rect.y == b->rect.y && a->rect.x < b->rect.x);
                       });

      std::vector<std::string> words;
      for (const Span *span : inside) {
        words.push_back(span->text);
      }
      table.header.cells.push_back(cell);
      table.header.names.push_back(text::joinNonEmpty(words, " "));
    }

    tables.push_back(table);
  }

  std::sort(tables.begin(), tables.end(),
            [](const TableStructure &a, const TableStructure &b) {
              return a.bbox.y < b.bbox.y;
            });
  return tables;
}

ScrapeResult PdfScraper::scrapeDocument(const std::string &pdfPath,
                                        bool widgetsOnly) const {
  ScrapeResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    // Initialize Poppler's global parameters for the core API
    GlobalParamsIniter globalParamsInit(nullptr);

    auto fileName = std::make_unique<GooString>(pdfPath);
    std::unique_ptr<PDFDoc> coreDoc(new PDFDoc(std::move(fileName)));

    if (!coreDoc->isOk()) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    int pageCount = doc->pages();
    if (m_config.verbose) {
      std::cerr << "DEBUG: PDF has " << pageCount << " pages" << std::endl;
    }

    for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
      ScrapedPage scraped;

      try {
        if (!widgetsOnly) {
          std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));
          if (page) {
            scraped.spans = extractSpans(*page);
          } else if (m_config.verbose) {
            std::cerr << "DEBUG: Failed to create page " << (pageIndex + 1)
                      << ", no text extracted" << std::endl;
          }
        }

        ::Page *corePage = coreDoc->getPage(pageIndex + 1);
        if (corePage) {
          scraped.widgets = extractWidgets(*corePage);

          if (!widgetsOnly && m_config.extractTables) {
            CellExtractorOutputDev outputDev(m_config.minCellSize);
            coreDoc->displayPage(&outputDev, pageIndex + 1, 72.0, 72.0, // DPI
                                 0,     // rotation
                                 false, // useMediaBox
                                 false, // crop
                                 false, // printing
                                 nullptr, nullptr, skipAnnotations, nullptr);
            scraped.tables =
                detectTables(outputDev.getCells(), scraped.spans, m_config);
          }
        }

        if (m_config.verbose) {
          std::cerr << "DEBUG: Page " << (pageIndex + 1) << ": "
                    << scraped.spans.size() << " spans, "
                    << scraped.widgets.size() << " widgets, "
                    << scraped.tables.size() << " tables" << std::endl;
        }
      } catch (const std::exception &e) {
        std::cerr << "DEBUG: Exception processing page " << (pageIndex + 1)
                  << ": " << e.what() << std::endl;
        scraped = ScrapedPage();
      }

      result.pages.push_back(std::move(scraped));
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace formtext
