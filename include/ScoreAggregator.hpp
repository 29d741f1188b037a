#ifndef PDFCMP_SCORE_AGGREGATOR_HPP
#define PDFCMP_SCORE_AGGREGATOR_HPP

#include "ScoringPolicy.hpp"

#include <optional>

namespace pdfcmp {

/**
 * @brief Combines the per-pair signals into one overall score
 *
 * overall = round(0.4 * text + 0.4 * visual + 0.2 * page, 4)
 */
class ScoreAggregator {
public:
  /**
   * @brief Page-count component
   *
   * 1.0 when the counts are equal, policy::kPageMismatchCredit otherwise,
   * however large the difference. Two unknown counts compare equal.
   */
  static double pageScore(const std::optional<int> &candidatePages,
                          const std::optional<int> &referencePages);

  /**
   * @brief Weighted overall score
   * @param pageScore Page-count component
   * @param textScore Text similarity
   * @param visualScore Visual average, or std::nullopt when no visual
   * comparison was performed (the text score is used in its place)
   * @return Score in [0, 1] rounded to policy::kScoreDecimals digits
   */
  static double aggregate(double pageScore, double textScore,
                          const std::optional<double> &visualScore);
};

} // namespace pdfcmp

#endif // PDFCMP_SCORE_AGGREGATOR_HPP
