#include "formtext/DocumentParser.hpp"
#include "formtext/LayoutRenderer.hpp"
#include "formtext/PdfScraper.hpp"

#include <iomanip>
#include <iostream>

#include <poppler-version.h>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <pdf_path> [options]\n"
      << "\nOptions:\n"
      << "  -l, --labels            Prefix field values with field names\n"
      << "  -f, --fields-only       Only print the form field values\n"
      << "  -t, --tolerance <pt>    Line and containment tolerance (default: "
         "5)\n"
      << "  -r, --render <dir>      Write layout overlay PNGs to <dir>\n"
      << "  -v, --verbose           Print debug output\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " form.pdf\n"
      << "  " << programName << " form.pdf -l -t 3\n"
      << "  " << programName << " form.pdf --render layout/\n";
}

void printFieldMap(const formtext::FieldValues &values) {
  std::cout << "\n[Field Values]\n";
  std::cout << "-------------------------------------------\n";
  std::cout << "Text:\n";
  for (const auto &entry : values.text) {
    std::cout << "  " << entry.first << " = " << entry.second << "\n";
  }
  std::cout << "Table:\n";
  for (const auto &entry : values.table) {
    std::cout << "  " << entry.first << " = " << entry.second << "\n";
  }
  std::cout << "-------------------------------------------\n";
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string pdfPath;
  std::string renderDir;
  formtext::ParserConfig parserConfig;
  formtext::ScraperConfig scraperConfig;
  bool fieldsOnly = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-l" || arg == "--labels") {
      parserConfig.renderMode = formtext::RenderMode::LabelAnnotated;
    } else if (arg == "-f" || arg == "--fields-only") {
      fieldsOnly = true;
    } else if (arg == "-t" || arg == "--tolerance") {
      if (i + 1 >= argc) {
        std::cerr << "Error: --tolerance requires an argument\n";
        return 1;
      }
      try {
        double tolerance = std::stod(argv[++i]);
        if (tolerance < 0) {
          std::cerr << "Error: --tolerance must not be negative\n";
          return 1;
        }
        parserConfig.lineTolerance = tolerance;
        parserConfig.containTolerance = tolerance;
      } catch (const std::exception &) {
        std::cerr << "Error: invalid tolerance '" << argv[i] << "'\n";
        return 1;
      }
    } else if (arg == "-r" || arg == "--render") {
      if (i + 1 < argc) {
        renderDir = argv[++i];
      } else {
        std::cerr << "Error: --render requires an argument\n";
        return 1;
      }
    } else if (arg == "-v" || arg == "--verbose") {
      parserConfig.verbose = true;
      scraperConfig.verbose = true;
    } else if (arg[0] != '-') {
      pdfPath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (pdfPath.empty()) {
    std::cerr << "Error: No PDF path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Display version info
  std::cout << "=== FormText ===\n"
            << "Poppler version: " << poppler::version_string() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "================\n\n";

  formtext::PdfScraper scraper(scraperConfig);

  std::cout << "Reading PDF: " << pdfPath << "\n";

  if (fieldsOnly) {
    auto scraped = scraper.scrapeWidgets(pdfPath);
    if (!scraped.success) {
      std::cerr << "Extraction failed: " << scraped.errorMessage << "\n";
      return 1;
    }

    printFieldMap(formtext::DocumentParser::collectFieldValues(scraped.pages));
    std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
              << scraped.processingTimeMs << " ms\n";
    return 0;
  }

  auto scraped = scraper.scrape(pdfPath);
  if (!scraped.success) {
    std::cerr << "Extraction failed: " << scraped.errorMessage << "\n";
    return 1;
  }

  formtext::DocumentParser parser(parserConfig);
  auto result = parser.parse(scraped.pages);

  if (!result.success) {
    std::cerr << "Parsing failed: " << result.errorMessage << "\n";
    return 1;
  }

  std::cout << "\n[Document Text]\n";
  std::cout << "-------------------------------------------\n";
  std::cout << result.documentText;
  std::cout << "-------------------------------------------\n";

  printFieldMap(result.fieldValues);

  for (const auto &error : result.pageErrors) {
    std::cerr << "Warning: " << error << "\n";
  }

  if (!renderDir.empty()) {
    auto rendered = formtext::LayoutRenderer::renderPages(
        pdfPath, result.document, renderDir);
    if (!rendered.success) {
      std::cerr << "Layout rendering failed: " << rendered.errorMessage
                << "\n";
      return 1;
    }
    for (const auto &path : rendered.outputPaths) {
      std::cout << "Layout written to: " << path << "\n";
    }
  }

  std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << (scraped.processingTimeMs + result.processingTimeMs) << " ms\n";
  std::cout << "Pages with content: " << result.document.pages.size() << " of "
            << scraped.pages.size() << "\n";

  return 0;
}
