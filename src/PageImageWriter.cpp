#include "PageImageWriter.hpp"

#include <opencv2/imgcodecs.hpp>

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace pdfcmp {

PageImageWriter::PageImageWriter(std::string outputDir)
    : m_outputDir(std::move(outputDir)) {}

std::vector<PageImages> PageImageWriter::write(
    const std::string &name,
    const std::vector<std::optional<PixelBuffer>> &candidatePages,
    const std::vector<std::optional<PixelBuffer>> &referencePages) const {
  std::vector<PageImages> entries;
  const std::size_t pageCount =
      std::max(candidatePages.size(), referencePages.size());
  if (pageCount == 0) {
    return entries;
  }

  std::error_code ec;
  std::filesystem::create_directories(m_outputDir, ec);
  if (ec) {
    std::cerr << "Cannot create image directory " << m_outputDir << ": "
              << ec.message() << std::endl;
  }

  for (std::size_t i = 0; i < pageCount; ++i) {
    PageImages entry;
    entry.page = static_cast<int>(i) + 1;
    const std::string prefix = name + "_p" + std::to_string(entry.page);

    if (i < candidatePages.size() && candidatePages[i]) {
      entry.candidateImage =
          writeImage(prefix + "_candidate.png", *candidatePages[i]);
    }
    if (i < referencePages.size() && referencePages[i]) {
      entry.referenceImage =
          writeImage(prefix + "_reference.png", *referencePages[i]);
    }

    entries.push_back(entry);
  }

  return entries;
}

std::optional<std::string>
PageImageWriter::writeImage(const std::string &fileName,
                            const PixelBuffer &buffer) const {
  if (buffer.samples.empty()) {
    return std::nullopt;
  }

  const std::filesystem::path outputPath =
      std::filesystem::path(m_outputDir) / fileName;
  try {
    if (!cv::imwrite(outputPath.string(), buffer.samples)) {
      std::cerr << "Failed to write page image: " << outputPath << std::endl;
      return std::nullopt;
    }
  } catch (const cv::Exception &e) {
    std::cerr << "Failed to write page image " << outputPath << ": "
              << e.what() << std::endl;
    return std::nullopt;
  }

  return fileName;
}

} // namespace pdfcmp
