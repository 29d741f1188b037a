#include "ScoreAggregator.hpp"

namespace pdfcmp {

double ScoreAggregator::pageScore(const std::optional<int> &candidatePages,
                                  const std::optional<int> &referencePages) {
  return candidatePages == referencePages ? 1.0
                                          : policy::kPageMismatchCredit;
}

double ScoreAggregator::aggregate(double pageScore, double textScore,
                                  const std::optional<double> &visualScore) {
  const double visual = visualScore.value_or(textScore);
  return roundScore(textScore * policy::kTextWeight +
                    visual * policy::kVisualWeight +
                    pageScore * policy::kPageWeight);
}

} // namespace pdfcmp
