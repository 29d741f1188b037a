#include "PageRasterizer.hpp"

namespace pdfcmp {

PageRasterizer::PageRasterizer(
    std::shared_ptr<const DocumentRenderer> renderer, double dpi)
    : m_renderer(std::move(renderer)), m_dpi(dpi) {}

std::optional<PixelBuffer> PageRasterizer::render(const std::string &pdfPath,
                                                  int pageIndex) const {
  std::unique_ptr<RenderedDocument> doc = m_renderer->open(pdfPath);
  return doc->renderPage(pageIndex, m_dpi);
}

std::vector<std::optional<PixelBuffer>>
PageRasterizer::renderPages(const std::string &pdfPath, int pageLimit) const {
  std::vector<std::optional<PixelBuffer>> pages;
  if (pageLimit <= 0) {
    return pages;
  }
  pages.reserve(static_cast<std::size_t>(pageLimit));

  std::unique_ptr<RenderedDocument> doc = m_renderer->open(pdfPath);
  for (int pageIndex = 0; pageIndex < pageLimit; pageIndex++) {
    pages.push_back(doc->renderPage(pageIndex, m_dpi));
  }

  return pages;
}

} // namespace pdfcmp
