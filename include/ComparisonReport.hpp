#ifndef PDFCMP_COMPARISON_REPORT_HPP
#define PDFCMP_COMPARISON_REPORT_HPP

#include "PdfComparator.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief A case flagged as needing attention
 */
struct LowScoreCase {
  std::string name;
  double score = 0.0;
};

/**
 * @brief Batch-level statistics derived from all pair results
 */
struct ReportSummary {
  std::size_t total = 0;          ///< Number of cases
  double averageScore = 0.0;      ///< Mean overall score (0 if no cases)
  std::size_t passing = 0;        ///< Cases at or above the threshold
  std::size_t needsAttention = 0; ///< Cases below the threshold
  std::size_t errors = 0;         ///< Cases with an error recorded
  std::vector<LowScoreCase> lowScores; ///< Below threshold, lowest first
};

/**
 * @brief Immutable batch report over an ordered set of pair results
 *
 * The summary is computed once on construction. Rendering to Markdown and
 * JSON only reads the results.
 */
class ComparisonReport {
public:
  explicit ComparisonReport(std::vector<PairResult> results);

  const std::vector<PairResult> &results() const { return m_results; }
  const ReportSummary &summary() const { return m_summary; }

  /**
   * @brief Derive batch statistics
   *
   * Cases below policy::kLowScoreThreshold are listed in ascending score
   * order; equal scores keep their input order.
   */
  static ReportSummary summarize(const std::vector<PairResult> &results);

  /**
   * @brief One JSON object per pair result, in input order
   *
   * Unknown page counts are written as "?". Fields that were not computed
   * are omitted.
   */
  nlohmann::json toJson() const;

  /**
   * @brief Human-readable report
   * @param generatedAt Timestamp printed under the title
   */
  std::string toMarkdown(const std::string &generatedAt) const;

  /**
   * @brief Write toJson() to a file, pretty-printed
   * @throws std::runtime_error if the file cannot be written
   */
  void writeJson(const std::string &path) const;

  /**
   * @brief Write toMarkdown() to a file
   * @throws std::runtime_error if the file cannot be written
   */
  void writeMarkdown(const std::string &path,
                     const std::string &generatedAt) const;

  /**
   * @brief Colored marker for a score tier (>= 0.9, >= 0.7, below)
   */
  static std::string tierMarker(double score);

  /**
   * @brief Format a score the way it appears in reports ("1.0", "0.9512")
   */
  static std::string formatScore(double score);

private:
  static nlohmann::json toJson(const PairResult &result);

  std::vector<PairResult> m_results;
  ReportSummary m_summary;
};

} // namespace pdfcmp

#endif // PDFCMP_COMPARISON_REPORT_HPP
