#ifndef PDFCMP_PAGE_RASTERIZER_HPP
#define PDFCMP_PAGE_RASTERIZER_HPP

#include "DocumentRenderer.hpp"
#include "ScoringPolicy.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief Renders PDF pages to pixel buffers at a fixed resolution
 *
 * Every call opens the document and releases it before returning.
 */
class PageRasterizer {
public:
  explicit PageRasterizer(std::shared_ptr<const DocumentRenderer> renderer,
                          double dpi = policy::kDefaultDpi);

  /**
   * @brief Render a single page
   * @param pdfPath Path to the PDF file
   * @param pageIndex 0-indexed page number
   * @return The page pixels, or std::nullopt if the page does not exist
   * @throws RenderError if the document cannot be opened or rendered
   */
  std::optional<PixelBuffer> render(const std::string &pdfPath,
                                    int pageIndex) const;

  /**
   * @brief Render pages [0, pageLimit) with one open of the document
   *
   * Entries past the document's last page are std::nullopt, so the result
   * always has pageLimit entries.
   */
  std::vector<std::optional<PixelBuffer>>
  renderPages(const std::string &pdfPath, int pageLimit) const;

  double dpi() const { return m_dpi; }

private:
  std::shared_ptr<const DocumentRenderer> m_renderer;
  double m_dpi;
};

} // namespace pdfcmp

#endif // PDFCMP_PAGE_RASTERIZER_HPP
