#ifndef PDFCMP_TEXT_SIMILARITY_HPP
#define PDFCMP_TEXT_SIMILARITY_HPP

#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief Decode UTF-8 into code points
 *
 * Malformed sequences decode to U+FFFD, one per offending byte.
 */
std::u32string decodeUtf8(const std::string &text);

/**
 * @brief Join pages with the page-break marker and trim surrounding
 * whitespace
 *
 * Trimming removes Unicode whitespace (U+00A0, U+3000 and the like), not
 * just ASCII blanks.
 */
std::string flattenPages(const std::vector<std::string> &pages);

/**
 * @brief Replace every page-break marker with a single newline
 */
std::string stripPageBreaks(const std::string &flatText);

/**
 * @brief Sequence-alignment similarity of two texts, compared per code point
 * @return 2 * matched / (|a| + |b|), or 1.0 when both are empty
 */
double similarityRatio(const std::string &a, const std::string &b);

/**
 * @brief Similarity of the flattened texts with page-break markers kept
 * @return Rounded score in [0, 1]; exactly 1.0 when both texts are empty
 */
double pageAwareSimilarity(const std::string &flatA, const std::string &flatB);

/**
 * @brief Similarity of the flattened texts with page-break markers removed
 *
 * Moving content across a page boundary does not lower this score.
 *
 * @return Rounded score in [0, 1]; exactly 1.0 when both texts are empty
 */
double pageAgnosticSimilarity(const std::string &flatA,
                              const std::string &flatB);

} // namespace pdfcmp

#endif // PDFCMP_TEXT_SIMILARITY_HPP
