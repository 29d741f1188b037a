#ifndef PDFCMP_TESTS_FAKE_RENDERER_HPP
#define PDFCMP_TESTS_FAKE_RENDERER_HPP

#include "DocumentRenderer.hpp"

#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdfcmp {
namespace test {

/**
 * @brief One page served by FakeRenderer
 */
struct FakePage {
  std::string text;
  std::optional<PixelBuffer> pixels;
  bool failsToRender = false; ///< renderPage throws RenderError
};

/**
 * @brief In-memory renderer keyed by file path
 *
 * Paths that were not registered fail to open, like an unreadable PDF.
 */
class FakeRenderer : public DocumentRenderer {
public:
  bool isAvailable() const override { return true; }
  std::string name() const override { return "fake"; }

  std::unique_ptr<RenderedDocument>
  open(const std::string &path) const override {
    ++m_openCount;
    auto failure = m_failures.find(path);
    if (failure != m_failures.end()) {
      throw RenderError(failure->second);
    }
    auto found = m_documents.find(path);
    if (found == m_documents.end()) {
      throw RenderError("Failed to load PDF file: " + path);
    }
    return std::make_unique<Document>(found->second, m_liveDocuments);
  }

  void add(const std::string &path, std::vector<FakePage> pages) {
    m_documents[path] = std::move(pages);
  }

  /// Opening path throws RenderError with exactly this message
  void failWith(const std::string &path, const std::string &message) {
    m_failures[path] = message;
  }

  int openCount() const { return m_openCount; }

  /// Documents opened and not yet destroyed
  int liveDocuments() const { return *m_liveDocuments; }

private:
  class Document : public RenderedDocument {
  public:
    Document(std::vector<FakePage> pages, std::shared_ptr<int> liveCount)
        : m_pages(std::move(pages)), m_liveCount(std::move(liveCount)) {
      ++*m_liveCount;
    }

    ~Document() override { --*m_liveCount; }

    int pageCount() const override { return static_cast<int>(m_pages.size()); }

    std::string pageText(int pageIndex) const override {
      return m_pages.at(static_cast<std::size_t>(pageIndex)).text;
    }

    std::optional<PixelBuffer> renderPage(int pageIndex,
                                          double /*dpi*/) const override {
      if (pageIndex < 0 || pageIndex >= pageCount()) {
        return std::nullopt;
      }
      const FakePage &page = m_pages[static_cast<std::size_t>(pageIndex)];
      if (page.failsToRender) {
        throw RenderError("Failed to render page " +
                          std::to_string(pageIndex + 1));
      }
      return page.pixels;
    }

  private:
    std::vector<FakePage> m_pages;
    std::shared_ptr<int> m_liveCount;
  };

  std::map<std::string, std::vector<FakePage>> m_documents;
  std::map<std::string, std::string> m_failures;
  std::shared_ptr<int> m_liveDocuments = std::make_shared<int>(0);
  mutable int m_openCount = 0;
};

/// Solid 3-channel page of the given size
inline PixelBuffer solidPage(int width, int height, unsigned char value) {
  PixelBuffer buffer;
  buffer.width = width;
  buffer.height = height;
  buffer.samples = cv::Mat(height, width, CV_8UC3, cv::Scalar::all(value));
  return buffer;
}

/**
 * @brief Scratch directory removed when the test ends
 */
class TempDir {
public:
  explicit TempDir(const std::string &name)
      : m_path(std::filesystem::temp_directory_path() /
               ("pdfcmp_" + name)) {
    std::filesystem::remove_all(m_path);
    std::filesystem::create_directories(m_path);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  /// Create a file with the given content and return its path
  std::string write(const std::string &fileName,
                    const std::string &content) const {
    const std::filesystem::path file = m_path / fileName;
    std::ofstream out(file, std::ios::binary);
    out << content;
    return file.string();
  }

  std::string path(const std::string &fileName) const {
    return (m_path / fileName).string();
  }

private:
  std::filesystem::path m_path;
};

} // namespace test
} // namespace pdfcmp

#endif // PDFCMP_TESTS_FAKE_RENDERER_HPP
