#ifndef PDFCMP_TEXT_DIFF_HPP
#define PDFCMP_TEXT_DIFF_HPP

#include "ScoringPolicy.hpp"

#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief Split UTF-8 text into lines
 *
 * Line boundaries are "\n", "\r\n", "\r", "\v", "\f", "\x1c" to "\x1e",
 * U+0085, U+2028 and U+2029. A trailing terminator does not produce an extra
 * empty line.
 *
 * @param text Text to split
 * @param keepEnds Keep each line's terminator attached to it
 */
std::vector<std::string> splitLines(const std::string &text,
                                    bool keepEnds = false);

/**
 * @brief Line-based unified diff of two texts
 *
 * Lines are matched with their terminators, so a final line without one
 * differs from the same text followed by a newline. Output lines are shown
 * without terminators and joined with "\n": the "--- fromFile" and "+++ toFile"
 * headers, then one "@@ -l,s +l,s @@" header per hunk followed by its
 * context (' '), removed ('-') and added ('+') lines.
 *
 * @param from Original text
 * @param to New text
 * @param fromFile Label for the original text
 * @param toFile Label for the new text
 * @param context Number of unchanged lines shown around each change
 * @return The diff, or an empty string when the texts have the same lines
 */
std::string unifiedDiff(const std::string &from, const std::string &to,
                        const std::string &fromFile, const std::string &toFile,
                        int context = policy::kDiffContextLines);

} // namespace pdfcmp

#endif // PDFCMP_TEXT_DIFF_HPP
