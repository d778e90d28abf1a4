#include "formtext/LayoutRenderer.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace formtext {

namespace {

const cv::Scalar kLineColor(0, 255, 0);
const cv::Scalar kTableColor(255, 0, 0);
const cv::Scalar kHeaderColor(255, 255, 0);
const cv::Scalar kWidgetColor(0, 0, 255);

cv::Rect toPixels(const Rect &rect, double scale) {
  return cv::Rect(cv::Point(cvRound(rect.x * scale), cvRound(rect.y * scale)),
                  cv::Point(cvRound((rect.x + rect.width) * scale),
                            cvRound((rect.y + rect.height) * scale)));
}

bool toBgr(const poppler::image &popplerImage, cv::Mat &mat) {
  int width = popplerImage.width();
  int height = popplerImage.height();

  switch (popplerImage.format()) {
  case poppler::image::format_argb32:
    // Stored as BGRA on little-endian machines
    mat = cv::Mat(height, width, CV_8UC4,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_BGRA2BGR);
    return true;
  case poppler::image::format_rgb24:
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    cv::cvtColor(mat, mat, cv::COLOR_RGB2BGR);
    return true;
  case poppler::image::format_bgr24:
    mat = cv::Mat(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    return true;
  case poppler::image::format_gray8:
    mat = cv::Mat(height, width, CV_8UC1,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row())
              .clone();
    return true;
  default:
    return false;
  }
}

} // anonymous namespace

cv::Mat LayoutRenderer::drawLayout(const cv::Mat &image, const Page &page,
                                   double scale) {
  cv::Mat output;
  if (image.channels() == 1) {
    cv::cvtColor(image, output, cv::COLOR_GRAY2BGR);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, output, cv::COLOR_BGRA2BGR);
  } else {
    output = image.clone();
  }

  for (const auto &line : page.lines) {
    cv::rectangle(output, toPixels(line.rect(), scale), kLineColor, 1);
  }

  for (const auto &table : page.tables) {
    cv::rectangle(output, toPixels(table.rect, scale), kTableColor, 2);
    for (const auto &cell : table.headerCells) {
      cv::rectangle(output, toPixels(cell, scale), kHeaderColor, 1);
    }
  }

  // Widgets last so they stay visible on top of lines and cells
  for (WidgetRef widget : page.widgets) {
    cv::rectangle(output, toPixels(widget->rect, scale), kWidgetColor, 1);
  }

  return output;
}

LayoutRenderResult LayoutRenderer::renderPages(const std::string &pdfPath,
                                               const Document &document,
                                               const std::string &outputDir,
                                               double dpi) {
  LayoutRenderResult result;
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

    std::filesystem::create_directories(outputDir);
    const std::string stem = std::filesystem::path(pdfPath).stem().string();
    const double scale = dpi / 72.0;

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    for (const auto &page : document.pages) {
      int pageIndex = page.number - 1;
      if (pageIndex < 0 || pageIndex >= doc->pages()) {
        result.errorMessage =
            "Page " + std::to_string(page.number) + " is not in " + pdfPath;
        return result;
      }

      std::unique_ptr<poppler::page> pdfPage(doc->create_page(pageIndex));
      if (!pdfPage) {
        result.errorMessage =
            "Failed to create page " + std::to_string(page.number);
        return result;
      }

      poppler::image popplerImage =
          renderer.render_page(pdfPage.get(), dpi, dpi);
      cv::Mat mat;
      if (!popplerImage.is_valid() || !toBgr(popplerImage, mat)) {
        result.errorMessage =
            "Failed to render page " + std::to_string(page.number);
        return result;
      }

      cv::Mat annotated = drawLayout(mat, page, scale);

      std::filesystem::path outputPath =
          std::filesystem::path(outputDir) /
          (stem + "_page" + std::to_string(page.number) + "_layout.png");
      if (!cv::imwrite(outputPath.string(), annotated)) {
        result.errorMessage = "Failed to write " + outputPath.string();
        return result;
      }
      result.outputPaths.push_back(outputPath.string());
    }

    result.success = true;
  } catch (const std::exception &e) {
    result.errorMessage = std::string("Layout rendering failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace formtext
