#ifndef PDFCMP_PDF_COMPARATOR_HPP
#define PDFCMP_PDF_COMPARATOR_HPP

#include "DocumentRenderer.hpp"
#include "PageImageWriter.hpp"
#include "PageRasterizer.hpp"
#include "ScoringPolicy.hpp"
#include "TextExtractor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pdfcmp {

/**
 * @brief Configuration options for PDF comparison
 */
struct CompareConfig {
  double dpi = policy::kDefaultDpi; ///< Rasterization resolution
  bool savePageImages = false;  ///< Write per-page PNG snapshots
  std::string imagesDir = "images"; ///< Directory for the PNG snapshots
  bool verbose = false;             ///< Log per-case progress details
};

/**
 * @brief A document path resolved against the filesystem
 */
struct DocumentRef {
  std::string path;       ///< Path as given
  bool exists = false;    ///< Whether a regular file exists at path
  std::uintmax_t size = 0; ///< Size in bytes (0 if missing)

  /**
   * @brief Probe the filesystem once
   */
  static DocumentRef resolve(const std::string &path);
};

/**
 * @brief Progress of a single comparison
 */
enum class CompareState {
  NotStarted,
  ExistenceChecked,
  MissingCandidate,
  MissingReference,
  MetricsComputed,
  Finalized
};

/// Human-readable state name for log messages
const char *toString(CompareState state);

/**
 * @brief Outcome of comparing one candidate/reference pair
 *
 * When either input is missing, only the name, existence flags, error and
 * a zero overall score are set.
 */
struct PairResult {
  std::string name; ///< Case name (report label only)

  bool candidateExists = false; ///< Candidate file found
  bool referenceExists = false; ///< Reference file found

  std::optional<std::uintmax_t> candidateSize; ///< Candidate size in bytes
  std::optional<std::uintmax_t> referenceSize; ///< Reference size in bytes

  // Page counts are unknown when no renderer could open the document
  std::optional<int> candidatePages;
  std::optional<int> referencePages;

  std::optional<std::string> candidateText; ///< Flattened candidate text
  std::optional<std::string> referenceText; ///< Flattened reference text

  std::optional<double> pageAwareTextSimilarity; ///< Page breaks kept
  std::optional<double> flatTextSimilarity;      ///< Page breaks removed
  std::optional<double> textSimilarity; ///< Max of the two views

  /// Unified diff of the flattened texts, or policy::kIdenticalMarker
  std::optional<std::string> textDiff;

  std::vector<double> visualScores;   ///< Per-page pixel similarity
  std::optional<double> visualAverage; ///< Unset when rendering unavailable
  std::vector<PageImages> pageImages;  ///< PNG snapshots, when enabled

  double overallScore = 0.0; ///< Weighted score in [0, 1]

  std::optional<std::string> error; ///< Why the pair could not be scored
  std::optional<std::string>
      textExtractWarning; ///< Set when text fell back to string scraping

  /// True when metrics were computed (both inputs exist, no failure)
  bool hasMetrics() const { return textSimilarity.has_value(); }
};

/**
 * @brief One named pair of documents to compare
 */
struct ComparisonCase {
  std::string name;
  std::string candidatePath;
  std::string referencePath;
};

/**
 * @brief Compares candidate PDFs against reference PDFs
 *
 * Drives one pair through existence checks, text extraction, text and pixel
 * similarity, and score aggregation. Failures stay local to the pair: every
 * call returns a PairResult and never throws for bad input files.
 *
 * Example usage:
 * @code
 * pdfcmp::PdfComparator comparator(pdfcmp::createRenderer(true));
 * auto result = comparator.compare("basic", "out/basic.pdf", "ref/basic.pdf");
 * std::cout << result.overallScore << std::endl;
 * @endcode
 */
class PdfComparator {
public:
  /**
   * @brief Constructor
   * @param renderer Rendering capability shared by all comparisons
   * @param config Comparison options
   */
  explicit PdfComparator(std::shared_ptr<const DocumentRenderer> renderer,
                         const CompareConfig &config = CompareConfig());

  /**
   * @brief Compare one pair of documents
   * @param name Case name used in the report and in diff headers
   * @param candidatePath Path to the generated PDF
   * @param referencePath Path to the reference PDF
   * @return The finalized result for this pair
   */
  PairResult compare(const std::string &name, const std::string &candidatePath,
                     const std::string &referencePath) const;

  /**
   * @brief Compare every case in order
   * @return One result per case, in input order
   */
  std::vector<PairResult>
  compareAll(const std::vector<ComparisonCase> &cases) const;

  /**
   * @brief Get the current configuration
   */
  const CompareConfig &getConfig() const;

private:
  void computeMetrics(PairResult &result, const DocumentRef &candidate,
                      const DocumentRef &reference) const;

  void compareText(PairResult &result, const DocumentRef &candidate,
                   const DocumentRef &reference) const;

  void compareVisuals(PairResult &result, const DocumentRef &candidate,
                      const DocumentRef &reference) const;

  std::optional<int> probePageCount(const std::string &pdfPath) const;

  std::vector<std::optional<PixelBuffer>>
  renderSide(const std::string &pdfPath,
             const std::optional<int> &pageCount) const;

  void transition(const std::string &name, CompareState &state,
                  CompareState next) const;

  std::shared_ptr<const DocumentRenderer> m_renderer; ///< Shared capability
  CompareConfig m_config;                             ///< Current options
  TextExtractor m_textExtractor;                      ///< Page text source
  PageRasterizer m_rasterizer;                        ///< Page pixel source
};

} // namespace pdfcmp

#endif // PDFCMP_PDF_COMPARATOR_HPP
