#ifndef PDFCMP_PIXEL_SIMILARITY_HPP
#define PDFCMP_PIXEL_SIMILARITY_HPP

#include "DocumentRenderer.hpp"

#include <optional>
#include <vector>

namespace pdfcmp {

/**
 * @brief Byte-exact pixel comparison of rendered pages
 */
class PixelSimilarity {
public:
  /**
   * @brief Fraction of equal samples between two rendered pages
   *
   * - Either page absent: 0.0.
   * - Same dimensions: equal samples / total samples, 1.0 if there are no
   *   samples.
   * - Different dimensions: only the common prefix of the flat sample
   *   sequences is compared, 0.0 if that prefix is empty. No resampling is
   *   attempted.
   *
   * @return Score in [0, 1]
   */
  static double score(const std::optional<PixelBuffer> &a,
                      const std::optional<PixelBuffer> &b);

  /**
   * @brief Score every page position of two documents
   *
   * The shorter list is padded with absent pages, so a page missing on one
   * side scores 0.0. Each score is rounded to the report precision.
   */
  static std::vector<double>
  scorePages(const std::vector<std::optional<PixelBuffer>> &pagesA,
             const std::vector<std::optional<PixelBuffer>> &pagesB);

  /**
   * @brief Rounded arithmetic mean of per-page scores, 0.0 if empty
   */
  static double average(const std::vector<double> &pageScores);

private:
  /// Count equal bytes in the first `length` samples of both buffers
  static std::size_t countEqualSamples(const cv::Mat &a, const cv::Mat &b,
                                       std::size_t length);
};

} // namespace pdfcmp

#endif // PDFCMP_PIXEL_SIMILARITY_HPP
