#include "TextDiff.hpp"

#include "SequenceMatcher.hpp"

#include <sstream>

namespace pdfcmp {

namespace {

// Hunk range as "start,length", 1-indexed; a single line omits the length
std::string formatRange(std::size_t start, std::size_t stop) {
  std::size_t beginning = start + 1;
  std::size_t length = stop - start;
  if (length == 1) {
    return std::to_string(beginning);
  }
  if (length == 0) {
    beginning -= 1;
  }
  return std::to_string(beginning) + "," + std::to_string(length);
}

// Byte length of the line terminator starting at i, or 0
std::size_t terminatorLength(const std::string &text, std::size_t i) {
  switch (text[i]) {
  case '\r':
    return i + 1 < text.size() && text[i + 1] == '\n' ? 2 : 1;
  case '\n':
  case '\v':
  case '\f':
  case '\x1c':
  case '\x1d':
  case '\x1e':
    return 1;
  default:
    break;
  }

  // U+0085, U+2028 and U+2029
  if (text.compare(i, 2, "\xC2\x85") == 0) {
    return 2;
  }
  if (text.compare(i, 3, "\xE2\x80\xA8") == 0 ||
      text.compare(i, 3, "\xE2\x80\xA9") == 0) {
    return 3;
  }
  return 0;
}

} // namespace

std::vector<std::string> splitLines(const std::string &text, bool keepEnds) {
  std::vector<std::string> lines;
  std::size_t lineStart = 0;
  std::size_t i = 0;

  while (i < text.size()) {
    std::size_t terminator = terminatorLength(text, i);
    if (terminator == 0) {
      ++i;
      continue;
    }
    const std::size_t lineEnd = keepEnds ? i + terminator : i;
    lines.push_back(text.substr(lineStart, lineEnd - lineStart));
    i += terminator;
    lineStart = i;
  }
  if (lineStart < text.size()) {
    lines.push_back(text.substr(lineStart));
  }

  return lines;
}

std::string unifiedDiff(const std::string &from, const std::string &to,
                        const std::string &fromFile, const std::string &toFile,
                        int context) {
  using Matcher = SequenceMatcher<std::string>;

  Matcher matcher(splitLines(from, true), splitLines(to, true));
  const std::vector<std::string> a = splitLines(from);
  const std::vector<std::string> b = splitLines(to);

  auto groups =
      matcher.groupedOpcodes(static_cast<std::size_t>(context < 0 ? 0 : context));
  if (groups.empty()) {
    return std::string();
  }

  std::ostringstream out;
  out << "--- " << fromFile << "\n";
  out << "+++ " << toFile;

  for (const auto &group : groups) {
    const auto &first = group.front();
    const auto &last = group.back();
    out << "\n@@ -" << formatRange(first.i1, last.i2) << " +"
        << formatRange(first.j1, last.j2) << " @@";

    for (const auto &code : group) {
      if (code.tag == Matcher::OpTag::Equal) {
        for (std::size_t i = code.i1; i < code.i2; ++i) {
          out << "\n " << a[i];
        }
        continue;
      }
      if (code.tag == Matcher::OpTag::Replace ||
          code.tag == Matcher::OpTag::Delete) {
        for (std::size_t i = code.i1; i < code.i2; ++i) {
          out << "\n-" << a[i];
        }
      }
      if (code.tag == Matcher::OpTag::Replace ||
          code.tag == Matcher::OpTag::Insert) {
        for (std::size_t j = code.j1; j < code.j2; ++j) {
          out << "\n+" << b[j];
        }
      }
    }
  }

  return out.str();
}

} // namespace pdfcmp
