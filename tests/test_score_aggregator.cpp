#include <gtest/gtest.h>

#include "ScoreAggregator.hpp"

#include <vector>

using namespace pdfcmp;

TEST(ScoreAggregatorTest, PolicyConstants) {
  EXPECT_EQ(policy::kTextWeight, 0.4);
  EXPECT_EQ(policy::kVisualWeight, 0.4);
  EXPECT_EQ(policy::kPageWeight, 0.2);
  EXPECT_EQ(policy::kPageMismatchCredit, 0.5);
  EXPECT_EQ(policy::kLowScoreThreshold, 0.8);
  EXPECT_EQ(policy::kDefaultDpi, 150.0);
  EXPECT_EQ(policy::kScoreDecimals, 4);
}

TEST(ScoreAggregatorTest, PageScoreIsFlatPartialCredit) {
  EXPECT_EQ(ScoreAggregator::pageScore(3, 3), 1.0);
  EXPECT_EQ(ScoreAggregator::pageScore(1, 2), 0.5);
  EXPECT_EQ(ScoreAggregator::pageScore(1, 51), 0.5);
  EXPECT_EQ(ScoreAggregator::pageScore(0, 0), 1.0);
}

TEST(ScoreAggregatorTest, UnknownPageCounts) {
  EXPECT_EQ(ScoreAggregator::pageScore(std::nullopt, std::nullopt), 1.0);
  EXPECT_EQ(ScoreAggregator::pageScore(2, std::nullopt), 0.5);
}

TEST(ScoreAggregatorTest, PerfectMatchScoresOne) {
  EXPECT_EQ(ScoreAggregator::aggregate(1.0, 1.0, 1.0), 1.0);
}

TEST(ScoreAggregatorTest, MissingVisualFallsBackToText) {
  // 0.8 * text + 0.2 * page
  EXPECT_DOUBLE_EQ(ScoreAggregator::aggregate(1.0, 0.5, std::nullopt), 0.6);
  EXPECT_DOUBLE_EQ(ScoreAggregator::aggregate(0.5, 0.75, std::nullopt), 0.7);
}

TEST(ScoreAggregatorTest, ReconstructsFromComponents) {
  struct Case {
    int candidatePages;
    int referencePages;
    double text;
    std::optional<double> visual;
    double expected;
  };

  const std::vector<Case> cases = {
      {1, 1, 1.0, 1.0, 1.0},
      {1, 1, 0.9876, 0.5432, 0.8123},
      {1, 1, 0.0, 0.0, 0.2},
      {2, 2, 0.3333, 0.6667, 0.6},
      {3, 3, 0.1234, 0.9999, 0.6493},
      {1, 2, 1.0, 1.0, 0.9},
      {1, 2, 0.7512, 0.2, 0.4805},
      {5, 1, 0.0, 0.0, 0.1},
      {2, 4, 0.4444, 0.5555, 0.5},
      {10, 9, 0.95, 0.85, 0.82},
      {1, 1, 1.0, std::nullopt, 1.0},
      {1, 1, 0.0, std::nullopt, 0.2},
      {4, 4, 0.6543, std::nullopt, 0.7234},
      {2, 2, 0.9091, std::nullopt, 0.9273},
      {3, 3, 0.0001, std::nullopt, 0.2001},
      {1, 2, 1.0, std::nullopt, 0.9},
      {2, 1, 0.6061, std::nullopt, 0.5849},
      {7, 3, 0.0, std::nullopt, 0.1},
      {1, 3, 0.8889, std::nullopt, 0.8111},
      {6, 2, 0.5, std::nullopt, 0.5},
      {0, 0, 1.0, 0.0, 0.6},
      {0, 1, 0.25, std::nullopt, 0.3},
  };

  for (const auto &c : cases) {
    const double page = ScoreAggregator::pageScore(c.candidatePages,
                                                   c.referencePages);
    EXPECT_EQ(page, c.candidatePages == c.referencePages ? 1.0 : 0.5);

    const double overall = ScoreAggregator::aggregate(page, c.text, c.visual);
    EXPECT_DOUBLE_EQ(overall, c.expected)
        << "pages " << c.candidatePages << "/" << c.referencePages << " text "
        << c.text;
    EXPECT_GE(overall, 0.0);
    EXPECT_LE(overall, 1.0);
  }
}

TEST(ScoreAggregatorTest, RoundScoreUsesFourDecimals) {
  EXPECT_DOUBLE_EQ(roundScore(0.123449), 0.1234);
  EXPECT_DOUBLE_EQ(roundScore(0.12345678), 0.1235);
  EXPECT_EQ(roundScore(1.0), 1.0);
  EXPECT_EQ(roundScore(0.0), 0.0);
}

TEST(ScoreAggregatorTest, RoundScoreBreaksExactTiesToEven) {
  // 5/32 and 3/32 are exact in binary, so these are true ties
  EXPECT_DOUBLE_EQ(roundScore(0.15625), 0.1562);
  EXPECT_DOUBLE_EQ(roundScore(0.09375), 0.0938);
  EXPECT_DOUBLE_EQ(roundScore(0.046875), 0.0469);
  EXPECT_DOUBLE_EQ(roundScore(0.03125), 0.0312);
}

TEST(ScoreAggregatorTest, RoundScoreUsesExactBinaryValue) {
  // 0.00005 is stored slightly above the tie
  EXPECT_DOUBLE_EQ(roundScore(0.00005), 0.0001);
  EXPECT_DOUBLE_EQ(roundScore(0.81232), 0.8123);
}
