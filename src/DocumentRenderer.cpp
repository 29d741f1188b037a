#include "DocumentRenderer.hpp"

#include <opencv2/imgproc.hpp>

#include <iostream>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

namespace pdfcmp {

namespace {

class PopplerDocument : public RenderedDocument {
public:
  PopplerDocument(std::unique_ptr<poppler::document> doc, std::string path)
      : m_doc(std::move(doc)), m_path(std::move(path)) {}

  int pageCount() const override { return m_doc->pages(); }

  std::string pageText(int pageIndex) const override {
    std::unique_ptr<poppler::page> page(loadPage(pageIndex));

    poppler::byte_array textBytes = page->text().to_utf8();
    return std::string(textBytes.begin(), textBytes.end());
  }

  std::optional<PixelBuffer> renderPage(int pageIndex,
                                        double dpi) const override {
    if (pageIndex < 0 || pageIndex >= m_doc->pages()) {
      return std::nullopt;
    }

    if (!poppler::page_renderer::can_render()) {
      throw RenderError("Poppler was built without a rendering backend");
    }

    std::unique_ptr<poppler::page> page(loadPage(pageIndex));

    // Create page renderer with antialiasing
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    poppler::image popplerImage = renderer.render_page(page.get(), dpi, dpi);

    if (!popplerImage.is_valid()) {
      throw RenderError("Failed to render page " +
                        std::to_string(pageIndex + 1) + " of " + m_path);
    }

    int width = popplerImage.width();
    int height = popplerImage.height();

    // Convert Poppler image to a 3-channel OpenCV Mat, dropping alpha
    cv::Mat mat;

    switch (popplerImage.format()) {
    case poppler::image::format_argb32: {
      // ARGB32 is stored B, G, R, A in memory
      cv::Mat argb(height, width, CV_8UC4,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(argb, mat, cv::COLOR_BGRA2BGR);
      break;
    }
    case poppler::image::format_rgb24: {
      cv::Mat rgb(height, width, CV_8UC3,
                  const_cast<char *>(popplerImage.const_data()),
                  popplerImage.bytes_per_row());
      cv::cvtColor(rgb, mat, cv::COLOR_RGB2BGR);
      break;
    }
    case poppler::image::format_bgr24: {
      mat = cv::Mat(height, width, CV_8UC3,
                    const_cast<char *>(popplerImage.const_data()),
                    popplerImage.bytes_per_row())
                .clone();
      break;
    }
    case poppler::image::format_gray8: {
      cv::Mat gray(height, width, CV_8UC1,
                   const_cast<char *>(popplerImage.const_data()),
                   popplerImage.bytes_per_row());
      cv::cvtColor(gray, mat, cv::COLOR_GRAY2BGR);
      break;
    }
    default:
      throw RenderError("Unsupported image format from Poppler");
    }

    PixelBuffer buffer;
    buffer.width = width;
    buffer.height = height;
    buffer.samples = mat.isContinuous() ? mat : mat.clone();
    return buffer;
  }

private:
  poppler::page *loadPage(int pageIndex) const {
    if (pageIndex < 0 || pageIndex >= m_doc->pages()) {
      throw RenderError("Page " + std::to_string(pageIndex + 1) +
                        " out of range in " + m_path);
    }
    poppler::page *page = m_doc->create_page(pageIndex);
    if (!page) {
      throw RenderError("Failed to create page " +
                        std::to_string(pageIndex + 1) + " of " + m_path);
    }
    return page;
  }

  std::unique_ptr<poppler::document> m_doc; ///< Open Poppler document
  std::string m_path;                       ///< Source path, for messages
};

} // namespace

std::unique_ptr<RenderedDocument>
PopplerRenderer::open(const std::string &path) const {
  std::unique_ptr<poppler::document> doc(
      poppler::document::load_from_file(path));

  if (!doc) {
    throw RenderError("Failed to load PDF file: " + path);
  }

  if (doc->is_locked()) {
    throw RenderError("PDF file is password protected: " + path);
  }

  return std::make_unique<PopplerDocument>(std::move(doc), path);
}

std::string PopplerRenderer::getPopplerVersion() {
  return poppler::version_string();
}

std::unique_ptr<RenderedDocument>
UnavailableRenderer::open(const std::string &path) const {
  throw RenderError("No PDF renderer available to open " + path);
}

std::shared_ptr<const DocumentRenderer> createRenderer(bool enableRendering) {
  if (!enableRendering) {
    std::cerr << "Rendering disabled: text falls back to raw string "
                 "extraction, visual comparison is skipped"
              << std::endl;
    return std::make_shared<UnavailableRenderer>();
  }
  return std::make_shared<PopplerRenderer>();
}

} // namespace pdfcmp
