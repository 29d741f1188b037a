#ifndef PDFCMP_SCORING_POLICY_HPP
#define PDFCMP_SCORING_POLICY_HPP

#include <cstddef>

namespace pdfcmp {

/**
 * @brief Fixed policy values used by the comparison engine
 *
 * Only the DPI can be overridden at runtime (see CompareConfig::dpi).
 */
namespace policy {

constexpr double kTextWeight = 0.4;   ///< Weight of the text similarity
constexpr double kVisualWeight = 0.4; ///< Weight of the visual similarity
constexpr double kPageWeight = 0.2;   ///< Weight of the page-count score

/// Page-count score when the page counts differ (regardless of the delta)
constexpr double kPageMismatchCredit = 0.5;

/// Cases scoring below this value are flagged as needing attention
constexpr double kLowScoreThreshold = 0.8;

/// Report tier boundaries
constexpr double kGoodScoreThreshold = 0.9;
constexpr double kFairScoreThreshold = 0.7;

/// Default rasterization resolution in dots per inch
constexpr double kDefaultDpi = 150.0;

/// Number of decimal digits scores are rounded to
constexpr int kScoreDecimals = 4;

/// Separator inserted between pages when flattening extracted text
constexpr const char *kPageBreakMarker = "\n---PAGE---\n";

/// Text diff value when both flattened texts are line-for-line equal
constexpr const char *kIdenticalMarker = "(identical)";

/// Context lines around each unified diff hunk
constexpr int kDiffContextLines = 3;

/// Markdown report truncates longer text diffs
constexpr std::size_t kMaxReportDiffChars = 3000;

} // namespace policy

/**
 * @brief Round a score to the fixed report precision
 *
 * Correctly rounded: 0.15625 becomes 0.1562 and 0.09375 becomes 0.0938.
 *
 * @param value Raw score
 * @return value rounded to policy::kScoreDecimals digits
 */
double roundScore(double value);

} // namespace pdfcmp

#endif // PDFCMP_SCORING_POLICY_HPP
