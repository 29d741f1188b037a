#include "TextExtractor.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

namespace pdfcmp {

namespace {

// Latin-1 maps every byte to the code point of the same value
void appendLatin1AsUtf8(std::string &out, unsigned char byte) {
  if (byte < 0x80) {
    out.push_back(static_cast<char>(byte));
  } else {
    out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
    out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
  }
}

} // namespace

TextExtractor::TextExtractor(std::shared_ptr<const DocumentRenderer> renderer)
    : m_renderer(std::move(renderer)) {}

TextExtraction TextExtractor::extract(const std::string &pdfPath) const {
  TextExtraction result;

  if (!m_renderer || !m_renderer->isAvailable()) {
    result.pages = extractFallback(pdfPath);
    result.usedFallback = true;
    return result;
  }

  try {
    result.pages = extractPrimary(pdfPath);
  } catch (const std::exception &e) {
    std::cerr << "Text extraction failed for " << pdfPath << ": " << e.what()
              << ", using raw string fallback" << std::endl;
    result.pages = extractFallback(pdfPath);
    result.usedFallback = true;
    result.warning = e.what();
  }

  return result;
}

std::vector<std::string>
TextExtractor::extractPrimary(const std::string &pdfPath) const {
  std::unique_ptr<RenderedDocument> doc = m_renderer->open(pdfPath);

  std::vector<std::string> pages;
  int pageCount = doc->pageCount();
  pages.reserve(pageCount > 0 ? static_cast<std::size_t>(pageCount) : 0);

  for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
    pages.push_back(doc->pageText(pageIndex));
  }

  return pages;
}

std::vector<std::string>
TextExtractor::extractFallback(const std::string &pdfPath) {
  std::ifstream file(pdfPath, std::ios::binary);
  if (!file) {
    std::cerr << "Fallback extraction could not read " << pdfPath << std::endl;
    return {std::string()};
  }

  std::string rawBytes((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
  return {scrapeLiteralStrings(rawBytes)};
}

std::string TextExtractor::scrapeLiteralStrings(const std::string &rawBytes) {
  // Equivalent to collecting every match of \(([^)]*)\) left to right:
  // a string runs from an opening parenthesis to the first closing one.
  std::string text;
  bool first = true;
  std::size_t pos = 0;

  while (pos < rawBytes.size()) {
    std::size_t open = rawBytes.find('(', pos);
    if (open == std::string::npos) {
      break;
    }
    std::size_t close = rawBytes.find(')', open + 1);
    if (close == std::string::npos) {
      break;
    }

    if (!first) {
      text.push_back('\n');
    }
    first = false;

    for (std::size_t i = open + 1; i < close; ++i) {
      appendLatin1AsUtf8(text, static_cast<unsigned char>(rawBytes[i]));
    }
    pos = close + 1;
  }

  return text;
}

} // namespace pdfcmp
