#ifndef PDFCMP_DOCUMENT_RENDERER_HPP
#define PDFCMP_DOCUMENT_RENDERER_HPP

#include <opencv2/core.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace pdfcmp {

/**
 * @brief One rendered page, without alpha
 *
 * Samples are stored in a continuous 8-bit, 3-channel (BGR) matrix, so the
 * flat sample sequence has width * height * 3 bytes.
 */
struct PixelBuffer {
  int width = 0;  ///< Width in pixels
  int height = 0; ///< Height in pixels
  cv::Mat samples; ///< Continuous CV_8UC3 pixel data (height x width)

  /// Number of bytes in the flat sample sequence
  std::size_t sampleCount() const {
    return samples.empty() ? 0 : samples.total() * samples.elemSize();
  }
};

/**
 * @brief Raised by a renderer when a document cannot be opened or read
 */
class RenderError : public std::runtime_error {
public:
  explicit RenderError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief An open document
 *
 * The underlying handle is released when the object is destroyed, so
 * holding it in a std::unique_ptr guarantees release on every exit path.
 */
class RenderedDocument {
public:
  virtual ~RenderedDocument() = default;

  /**
   * @brief Number of pages in the document
   */
  virtual int pageCount() const = 0;

  /**
   * @brief Extract the plain text of one page
   * @param pageIndex 0-indexed page number
   * @return UTF-8 text of the page
   * @throws RenderError if the page cannot be read
   */
  virtual std::string pageText(int pageIndex) const = 0;

  /**
   * @brief Rasterize one page
   * @param pageIndex 0-indexed page number
   * @param dpi Resolution in dots per inch
   * @return The page pixels, or std::nullopt if pageIndex is out of range
   * @throws RenderError if the page exists but rendering fails
   */
  virtual std::optional<PixelBuffer> renderPage(int pageIndex,
                                                double dpi) const = 0;
};

/**
 * @brief Text extraction and rendering capability
 *
 * Resolved once at startup and shared by every component that needs to
 * look inside a PDF. Implementations hold no per-document state and can be
 * used from several comparators at once.
 */
class DocumentRenderer {
public:
  virtual ~DocumentRenderer() = default;

  /**
   * @brief Whether this renderer can open documents at all
   */
  virtual bool isAvailable() const = 0;

  /**
   * @brief Short identifier used in log messages
   */
  virtual std::string name() const = 0;

  /**
   * @brief Open a document
   * @param path Path to the PDF file
   * @return The open document (never null)
   * @throws RenderError if the file cannot be loaded, is locked, or the
   * renderer is unavailable
   */
  virtual std::unique_ptr<RenderedDocument>
  open(const std::string &path) const = 0;
};

/**
 * @brief Renderer backed by the Poppler C++ wrapper
 */
class PopplerRenderer : public DocumentRenderer {
public:
  bool isAvailable() const override { return true; }
  std::string name() const override { return "poppler"; }
  std::unique_ptr<RenderedDocument>
  open(const std::string &path) const override;

  /**
   * @brief Version of the linked Poppler library
   */
  static std::string getPopplerVersion();
};

/**
 * @brief Stand-in used when rendering is disabled
 *
 * Text extraction falls back to raw string scraping and no visual scores
 * are computed.
 */
class UnavailableRenderer : public DocumentRenderer {
public:
  bool isAvailable() const override { return false; }
  std::string name() const override { return "unavailable"; }
  std::unique_ptr<RenderedDocument>
  open(const std::string &path) const override;
};

/**
 * @brief Select the process-wide renderer
 * @param enableRendering false selects UnavailableRenderer
 */
std::shared_ptr<const DocumentRenderer> createRenderer(bool enableRendering);

} // namespace pdfcmp

#endif // PDFCMP_DOCUMENT_RENDERER_HPP
