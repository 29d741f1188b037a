#include "PixelSimilarity.hpp"

#include "ScoringPolicy.hpp"

#include <algorithm>
#include <numeric>
#include <stdexcept>

namespace pdfcmp {

namespace {

// Flat single-channel row view over all sample bytes
cv::Mat flatSamples(const cv::Mat &samples) {
  if (samples.depth() != CV_8U) {
    throw std::invalid_argument("Pixel samples must be 8-bit");
  }
  cv::Mat continuous = samples.isContinuous() ? samples : samples.clone();
  return continuous.reshape(1, 1);
}

} // namespace

std::size_t PixelSimilarity::countEqualSamples(const cv::Mat &a,
                                               const cv::Mat &b,
                                               std::size_t length) {
  if (length == 0) {
    return 0;
  }

  cv::Mat flatA = flatSamples(a).colRange(0, static_cast<int>(length));
  cv::Mat flatB = flatSamples(b).colRange(0, static_cast<int>(length));

  cv::Mat equal;
  cv::compare(flatA, flatB, equal, cv::CMP_EQ);
  return static_cast<std::size_t>(cv::countNonZero(equal));
}

double PixelSimilarity::score(const std::optional<PixelBuffer> &a,
                              const std::optional<PixelBuffer> &b) {
  if (!a || !b) {
    return 0.0;
  }

  const std::size_t countA = a->sampleCount();
  const std::size_t countB = b->sampleCount();

  if (a->width == b->width && a->height == b->height && countA == countB) {
    if (countA == 0) {
      return 1.0;
    }
    return static_cast<double>(countEqualSamples(a->samples, b->samples,
                                                 countA)) /
           static_cast<double>(countA);
  }

  // Dimension mismatch: compare the common prefix of the sample sequences
  const std::size_t overlap = std::min(countA, countB);
  if (overlap == 0) {
    return 0.0;
  }
  return static_cast<double>(
             countEqualSamples(a->samples, b->samples, overlap)) /
         static_cast<double>(overlap);
}

std::vector<double> PixelSimilarity::scorePages(
    const std::vector<std::optional<PixelBuffer>> &pagesA,
    const std::vector<std::optional<PixelBuffer>> &pagesB) {
  const std::size_t pageCount = std::max(pagesA.size(), pagesB.size());
  const std::optional<PixelBuffer> absent;

  std::vector<double> scores;
  scores.reserve(pageCount);
  for (std::size_t i = 0; i < pageCount; ++i) {
    const auto &pageA = i < pagesA.size() ? pagesA[i] : absent;
    const auto &pageB = i < pagesB.size() ? pagesB[i] : absent;
    scores.push_back(roundScore(score(pageA, pageB)));
  }
  return scores;
}

double PixelSimilarity::average(const std::vector<double> &pageScores) {
  if (pageScores.empty()) {
    return 0.0;
  }
  double sum = std::accumulate(pageScores.begin(), pageScores.end(), 0.0);
  return roundScore(sum / static_cast<double>(pageScores.size()));
}

} // namespace pdfcmp
