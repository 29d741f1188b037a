#include <gtest/gtest.h>

#include "FakeRenderer.hpp"
#include "PixelSimilarity.hpp"

using namespace pdfcmp;
using pdfcmp::test::solidPage;

TEST(PixelSimilarityTest, AbsentBufferScoresZero) {
  std::optional<PixelBuffer> page = solidPage(10, 10, 0);
  EXPECT_EQ(PixelSimilarity::score(std::nullopt, page), 0.0);
  EXPECT_EQ(PixelSimilarity::score(page, std::nullopt), 0.0);
  EXPECT_EQ(PixelSimilarity::score(std::nullopt, std::nullopt), 0.0);
}

TEST(PixelSimilarityTest, IdenticalPagesScoreOne) {
  std::optional<PixelBuffer> a = solidPage(100, 100, 0);
  std::optional<PixelBuffer> b = solidPage(100, 100, 0);
  EXPECT_EQ(PixelSimilarity::score(a, b), 1.0);
}

TEST(PixelSimilarityTest, ZeroSizedPagesScoreOne) {
  std::optional<PixelBuffer> a = PixelBuffer();
  std::optional<PixelBuffer> b = PixelBuffer();
  EXPECT_EQ(PixelSimilarity::score(a, b), 1.0);
}

TEST(PixelSimilarityTest, CountsEqualSamples) {
  PixelBuffer a = solidPage(10, 10, 255);
  PixelBuffer b = solidPage(10, 10, 255);
  // Change one channel of 25 pixels: 25 of 300 samples differ
  for (int y = 0; y < 5; ++y) {
    for (int x = 0; x < 5; ++x) {
      b.samples.at<cv::Vec3b>(y, x)[0] = 0;
    }
  }
  EXPECT_DOUBLE_EQ(PixelSimilarity::score(a, b), 275.0 / 300.0);
}

TEST(PixelSimilarityTest, CompletelyDifferentPagesScoreZero) {
  EXPECT_EQ(PixelSimilarity::score(solidPage(20, 20, 0), solidPage(20, 20, 255)),
            0.0);
}

TEST(PixelSimilarityTest, DimensionMismatchComparesOverlap) {
  // 100x100 vs 100x50: only the first 100x50 rows' worth of samples count
  PixelBuffer tall = solidPage(100, 100, 0);
  PixelBuffer shortPage = solidPage(100, 50, 0);
  tall.samples.rowRange(50, 100).setTo(cv::Scalar::all(255));

  EXPECT_EQ(PixelSimilarity::score(tall, shortPage), 1.0);

  tall.samples.row(0).setTo(cv::Scalar::all(255));
  double score = PixelSimilarity::score(tall, shortPage);
  EXPECT_DOUBLE_EQ(score, 49.0 / 50.0);
}

TEST(PixelSimilarityTest, DimensionMismatchWithEmptyOverlapScoresZero) {
  EXPECT_EQ(PixelSimilarity::score(PixelBuffer(), solidPage(4, 4, 0)), 0.0);
}

TEST(PixelSimilarityTest, ScoresStayInUnitRange) {
  for (int value : {0, 17, 128, 255}) {
    double score =
        PixelSimilarity::score(solidPage(8, 6, 0), solidPage(6, 8, value));
    EXPECT_GE(score, 0.0);
    EXPECT_LE(score, 1.0);
  }
}

TEST(PixelSimilarityTest, MissingPagesCountAsZero) {
  std::vector<std::optional<PixelBuffer>> candidate = {solidPage(4, 4, 0),
                                                       solidPage(4, 4, 0)};
  std::vector<std::optional<PixelBuffer>> reference = {solidPage(4, 4, 0)};

  auto scores = PixelSimilarity::scorePages(candidate, reference);
  ASSERT_EQ(scores.size(), 2u);
  EXPECT_EQ(scores[0], 1.0);
  EXPECT_EQ(scores[1], 0.0);
  EXPECT_EQ(PixelSimilarity::average(scores), 0.5);
}

TEST(PixelSimilarityTest, PageScoresAreRounded) {
  PixelBuffer a = solidPage(3, 1, 0);
  PixelBuffer b = solidPage(3, 1, 0);
  b.samples.at<cv::Vec3b>(0, 0)[0] = 1; // 8 of 9 samples equal

  auto scores = PixelSimilarity::scorePages({a}, {b});
  ASSERT_EQ(scores.size(), 1u);
  EXPECT_DOUBLE_EQ(scores[0], 0.8889);
}

TEST(PixelSimilarityTest, AverageOfNoPagesIsZero) {
  EXPECT_EQ(PixelSimilarity::average({}), 0.0);
}
