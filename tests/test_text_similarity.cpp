#include <gtest/gtest.h>

#include "ScoringPolicy.hpp"
#include "TextSimilarity.hpp"

#include <algorithm>

using namespace pdfcmp;

TEST(TextSimilarityTest, FlattenJoinsPagesWithMarker) {
  EXPECT_EQ(flattenPages({"Hello", "World"}), "Hello\n---PAGE---\nWorld");
  EXPECT_EQ(flattenPages({"  Only page \n"}), "Only page");
  EXPECT_EQ(flattenPages({}), "");
}

TEST(TextSimilarityTest, FlattenTrimsMarkerAtEdges) {
  // A blank last page leaves a dangling marker whose newline is trimmed
  EXPECT_EQ(flattenPages({"Text", ""}), "Text\n---PAGE---");
  EXPECT_EQ(flattenPages({"", "", ""}), "---PAGE---\n\n---PAGE---");
}

TEST(TextSimilarityTest, FlattenTrimsUnicodeWhitespace) {
  // U+00A0, U+3000, U+2029 and U+0085 around the text
  EXPECT_EQ(flattenPages({"\xC2\xA0\xE3\x80\x80Text\xE2\x80\xA9\xC2\x85"}),
            "Text");
  // Interior whitespace and non-space multibyte edges are kept
  EXPECT_EQ(flattenPages({"\xC3\xA9 a\xC2\xA0" "b \xC3\xA9"}),
            "\xC3\xA9 a\xC2\xA0" "b \xC3\xA9");
  // A malformed trailing byte is not whitespace
  EXPECT_EQ(flattenPages({"x \xA0"}), "x \xA0");
}

TEST(TextSimilarityTest, StripPageBreaksKeepsOneNewline) {
  EXPECT_EQ(stripPageBreaks("a\n---PAGE---\nb\n---PAGE---\nc"), "a\nb\nc");
  EXPECT_EQ(stripPageBreaks("no markers"), "no markers");
}

TEST(TextSimilarityTest, BothEmptyIsExactlyOne) {
  EXPECT_EQ(similarityRatio("", ""), 1.0);
  EXPECT_EQ(pageAwareSimilarity("", ""), 1.0);
  EXPECT_EQ(pageAgnosticSimilarity("", ""), 1.0);
  EXPECT_EQ(pageAwareSimilarity(flattenPages({}), flattenPages({" \n"})), 1.0);
}

TEST(TextSimilarityTest, OneSideEmptyScoresZero) {
  EXPECT_EQ(pageAwareSimilarity("", "content"), 0.0);
  EXPECT_EQ(pageAgnosticSimilarity("content", ""), 0.0);
}

TEST(TextSimilarityTest, IdenticalTextScoresOne) {
  EXPECT_EQ(pageAwareSimilarity("Quarterly report", "Quarterly report"), 1.0);
}

TEST(TextSimilarityTest, RatioComparesCodePointsNotBytes) {
  // "é" is two UTF-8 bytes but one character
  EXPECT_NEAR(similarityRatio("caf\xC3\xA9", "cafe"), 6.0 / 8.0, 1e-12);
}

TEST(TextSimilarityTest, PageBoundaryShiftFavorsPageAgnosticView) {
  const std::string candidate = flattenPages({"Hello", "World"});
  const std::string reference = flattenPages({"Hello World"});

  const double pageAware = pageAwareSimilarity(candidate, reference);
  const double pageAgnostic = pageAgnosticSimilarity(candidate, reference);

  EXPECT_GT(pageAgnostic, pageAware);
  EXPECT_DOUBLE_EQ(pageAware, 0.6061);
  EXPECT_DOUBLE_EQ(pageAgnostic, 0.9091);
  EXPECT_EQ(std::max(pageAware, pageAgnostic), pageAgnostic);
}

TEST(TextSimilarityTest, ScoresAreRoundedToFourDecimals) {
  double score = pageAwareSimilarity("abxcd", "abcd");
  EXPECT_DOUBLE_EQ(score, 0.8889);
}

TEST(TextSimilarityTest, TiedRatioRoundsToEven) {
  // 5 of 32 characters match on each side: 10/64 = 0.15625 exactly
  const std::string candidate = "abcde" + std::string(27, 'x');
  const std::string reference = "abcde" + std::string(27, 'y');
  EXPECT_DOUBLE_EQ(pageAwareSimilarity(candidate, reference), 0.1562);
  EXPECT_DOUBLE_EQ(pageAgnosticSimilarity(candidate, reference), 0.1562);
}

TEST(TextSimilarityTest, DecodeUtf8ReplacesMalformedBytes) {
  std::u32string decoded = decodeUtf8("a\xFF" "b\xE2\x82\xAC");
  ASSERT_EQ(decoded.size(), 4u);
  EXPECT_EQ(decoded[0], U'a');
  EXPECT_EQ(decoded[1], static_cast<char32_t>(0xFFFD));
  EXPECT_EQ(decoded[2], U'b');
  EXPECT_EQ(decoded[3], static_cast<char32_t>(0x20AC));
}

TEST(TextSimilarityTest, DecodeUtf8RejectsTruncatedSequence) {
  std::u32string decoded = decodeUtf8("x\xE2\x82");
  ASSERT_EQ(decoded.size(), 3u);
  EXPECT_EQ(decoded[1], static_cast<char32_t>(0xFFFD));
  EXPECT_EQ(decoded[2], static_cast<char32_t>(0xFFFD));
}
