#include "TextSimilarity.hpp"

#include "ScoringPolicy.hpp"
#include "SequenceMatcher.hpp"

namespace pdfcmp {

namespace {

constexpr char32_t kReplacementChar = 0xFFFD;

// Decode the code point starting at byte i; malformed input yields one
// replacement character per byte
char32_t decodeAt(const std::string &text, std::size_t i, std::size_t &length) {
  const std::size_t n = text.size();
  unsigned char lead = static_cast<unsigned char>(text[i]);

  char32_t codePoint = 0;
  char32_t minimum = 0;
  length = 1;
  if (lead < 0x80) {
    return lead;
  } else if ((lead & 0xE0) == 0xC0) {
    length = 2;
    codePoint = lead & 0x1F;
    minimum = 0x80;
  } else if ((lead & 0xF0) == 0xE0) {
    length = 3;
    codePoint = lead & 0x0F;
    minimum = 0x800;
  } else if ((lead & 0xF8) == 0xF0) {
    length = 4;
    codePoint = lead & 0x07;
    minimum = 0x10000;
  } else {
    return kReplacementChar;
  }

  bool valid = i + length <= n;
  for (std::size_t k = 1; valid && k < length; ++k) {
    unsigned char next = static_cast<unsigned char>(text[i + k]);
    if ((next & 0xC0) != 0x80) {
      valid = false;
    } else {
      codePoint = (codePoint << 6) | (next & 0x3F);
    }
  }
  if (valid && (codePoint < minimum || codePoint > 0x10FFFF ||
                (codePoint >= 0xD800 && codePoint <= 0xDFFF))) {
    valid = false;
  }

  if (!valid) {
    length = 1;
    return kReplacementChar;
  }
  return codePoint;
}

// Unicode whitespace, including the information separators \x1c-\x1f
bool isWhitespace(char32_t c) {
  return (c >= 0x09 && c <= 0x0D) || (c >= 0x1C && c <= 0x20) || c == 0x85 ||
         c == 0xA0 || c == 0x1680 || (c >= 0x2000 && c <= 0x200A) ||
         c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F ||
         c == 0x3000;
}

std::string trim(const std::string &text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  std::size_t length = 0;

  while (begin < end && isWhitespace(decodeAt(text, begin, length))) {
    begin += length;
  }

  while (end > begin) {
    // Back up to the lead byte of the last code point
    std::size_t start = end - 1;
    while (start > begin && end - start < 4 &&
           (static_cast<unsigned char>(text[start]) & 0xC0) == 0x80) {
      --start;
    }
    char32_t last = decodeAt(text, start, length);
    if (start + length != end || !isWhitespace(last)) {
      break;
    }
    end = start;
  }

  return text.substr(begin, end - begin);
}

} // namespace

std::u32string decodeUtf8(const std::string &text) {
  std::u32string out;
  out.reserve(text.size());

  std::size_t i = 0;
  std::size_t length = 0;
  while (i < text.size()) {
    out.push_back(decodeAt(text, i, length));
    i += length;
  }

  return out;
}

std::string flattenPages(const std::vector<std::string> &pages) {
  std::string joined;
  for (std::size_t i = 0; i < pages.size(); ++i) {
    if (i > 0) {
      joined += policy::kPageBreakMarker;
    }
    joined += pages[i];
  }
  return trim(joined);
}

std::string stripPageBreaks(const std::string &flatText) {
  const std::string marker = policy::kPageBreakMarker;
  std::string out;
  out.reserve(flatText.size());

  std::size_t pos = 0;
  while (true) {
    std::size_t found = flatText.find(marker, pos);
    if (found == std::string::npos) {
      out.append(flatText, pos, std::string::npos);
      break;
    }
    out.append(flatText, pos, found - pos);
    out.push_back('\n');
    pos = found + marker.size();
  }
  return out;
}

double similarityRatio(const std::string &a, const std::string &b) {
  if (a.empty() && b.empty()) {
    return 1.0;
  }

  std::u32string codePointsA = decodeUtf8(a);
  std::u32string codePointsB = decodeUtf8(b);
  SequenceMatcher<char32_t> matcher(
      std::vector<char32_t>(codePointsA.begin(), codePointsA.end()),
      std::vector<char32_t>(codePointsB.begin(), codePointsB.end()));
  return matcher.ratio();
}

double pageAwareSimilarity(const std::string &flatA, const std::string &flatB) {
  return roundScore(similarityRatio(flatA, flatB));
}

double pageAgnosticSimilarity(const std::string &flatA,
                              const std::string &flatB) {
  return roundScore(
      similarityRatio(stripPageBreaks(flatA), stripPageBreaks(flatB)));
}

} // namespace pdfcmp
