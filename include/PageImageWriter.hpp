#ifndef PDFCMP_PAGE_IMAGE_WRITER_HPP
#define PDFCMP_PAGE_IMAGE_WRITER_HPP

#include "DocumentRenderer.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief PNG snapshots written for one page position
 */
struct PageImages {
  int page = 0; ///< 1-indexed page number
  std::optional<std::string> candidateImage; ///< File name, if rendered
  std::optional<std::string> referenceImage; ///< File name, if rendered
};

/**
 * @brief Saves rendered pages as PNG files for side-by-side inspection
 *
 * Files are named <case>_p<page>_candidate.png and
 * <case>_p<page>_reference.png inside the output directory.
 */
class PageImageWriter {
public:
  explicit PageImageWriter(std::string outputDir);

  /**
   * @brief Write both renderings of every page position
   * @param name Case name used as the file name prefix
   * @param candidatePages Candidate renderings (absent entries are skipped)
   * @param referencePages Reference renderings (absent entries are skipped)
   * @return One entry per page position, max of both list sizes
   */
  std::vector<PageImages>
  write(const std::string &name,
        const std::vector<std::optional<PixelBuffer>> &candidatePages,
        const std::vector<std::optional<PixelBuffer>> &referencePages) const;

  const std::string &outputDir() const { return m_outputDir; }

private:
  std::optional<std::string> writeImage(const std::string &fileName,
                                        const PixelBuffer &buffer) const;

  std::string m_outputDir;
};

} // namespace pdfcmp

#endif // PDFCMP_PAGE_IMAGE_WRITER_HPP
