#ifndef PDFCMP_TEXT_EXTRACTOR_HPP
#define PDFCMP_TEXT_EXTRACTOR_HPP

#include "DocumentRenderer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief Per-page text of one document
 */
struct TextExtraction {
  std::vector<std::string> pages; ///< UTF-8 text, one entry per page
  bool usedFallback = false;      ///< True if raw string scraping was used
  std::string warning; ///< Why the primary path failed (empty if it didn't)
};

/**
 * @brief Extracts page text, falling back to raw string scraping
 *
 * The primary path asks the renderer for the text of every page. If the
 * renderer is unavailable, or throws, the raw PDF bytes are scanned for
 * literal strings instead. extract() never throws.
 */
class TextExtractor {
public:
  explicit TextExtractor(std::shared_ptr<const DocumentRenderer> renderer);

  /**
   * @brief Extract the text of every page
   * @param pdfPath Path to the PDF file
   * @return Pages and, when the primary path failed, a warning
   */
  TextExtraction extract(const std::string &pdfPath) const;

  /**
   * @brief Extract text through the renderer only
   * @throws RenderError (or any std::exception from the renderer)
   */
  std::vector<std::string> extractPrimary(const std::string &pdfPath) const;

  /**
   * @brief Scrape literal "(...)" strings from the raw PDF bytes
   *
   * Bytes are decoded as Latin-1 so decoding cannot fail. An unreadable file
   * yields a single empty page.
   *
   * @param pdfPath Path to the PDF file
   * @return Exactly one page holding the strings joined by newlines
   */
  static std::vector<std::string> extractFallback(const std::string &pdfPath);

  /**
   * @brief Fallback scraping applied to bytes already in memory
   */
  static std::string scrapeLiteralStrings(const std::string &rawBytes);

private:
  std::shared_ptr<const DocumentRenderer> m_renderer;
};

} // namespace pdfcmp

#endif // PDFCMP_TEXT_EXTRACTOR_HPP
