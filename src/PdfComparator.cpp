#include "PdfComparator.hpp"

#include "PixelSimilarity.hpp"
#include "ScoreAggregator.hpp"
#include "TextDiff.hpp"
#include "TextSimilarity.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace pdfcmp {

DocumentRef DocumentRef::resolve(const std::string &path) {
  DocumentRef ref;
  ref.path = path;

  std::error_code ec;
  ref.exists = std::filesystem::is_regular_file(path, ec);
  if (ref.exists) {
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    ref.size = ec ? 0 : size;
  }
  return ref;
}

const char *toString(CompareState state) {
  switch (state) {
  case CompareState::NotStarted:
    return "NotStarted";
  case CompareState::ExistenceChecked:
    return "ExistenceChecked";
  case CompareState::MissingCandidate:
    return "MissingCandidate";
  case CompareState::MissingReference:
    return "MissingReference";
  case CompareState::MetricsComputed:
    return "MetricsComputed";
  case CompareState::Finalized:
    return "Finalized";
  }
  return "Unknown";
}

PdfComparator::PdfComparator(std::shared_ptr<const DocumentRenderer> renderer,
                             const CompareConfig &config)
    : m_renderer(renderer ? std::move(renderer)
                          : std::make_shared<UnavailableRenderer>()),
      m_config(config), m_textExtractor(m_renderer),
      m_rasterizer(m_renderer, config.dpi) {}

const CompareConfig &PdfComparator::getConfig() const { return m_config; }

void PdfComparator::transition(const std::string &name, CompareState &state,
                               CompareState next) const {
  if (m_config.verbose) {
    std::cerr << "[" << name << "] " << toString(state) << " -> "
              << toString(next) << std::endl;
  }
  state = next;
}

PairResult PdfComparator::compare(const std::string &name,
                                  const std::string &candidatePath,
                                  const std::string &referencePath) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  CompareState state = CompareState::NotStarted;
  PairResult result;
  result.name = name;

  const DocumentRef candidate = DocumentRef::resolve(candidatePath);
  const DocumentRef reference = DocumentRef::resolve(referencePath);
  result.candidateExists = candidate.exists;
  result.referenceExists = reference.exists;
  transition(name, state, CompareState::ExistenceChecked);

  if (!candidate.exists) {
    result.error = "Candidate PDF not found";
    result.overallScore = 0.0;
    transition(name, state, CompareState::MissingCandidate);
  } else if (!reference.exists) {
    result.error = "Reference PDF not found";
    result.overallScore = 0.0;
    transition(name, state, CompareState::MissingReference);
  } else {
    try {
      computeMetrics(result, candidate, reference);
    } catch (const std::exception &e) {
      std::cerr << "Comparison of " << name << " failed: " << e.what()
                << std::endl;
      PairResult failed;
      failed.name = name;
      failed.candidateExists = true;
      failed.referenceExists = true;
      failed.candidateSize = candidate.size;
      failed.referenceSize = reference.size;
      failed.error = std::string("Comparison failed: ") + e.what();
      failed.overallScore = 0.0;
      result = std::move(failed);
    }
    transition(name, state, CompareState::MetricsComputed);
  }

  transition(name, state, CompareState::Finalized);

  if (m_config.verbose) {
    auto endTime = std::chrono::high_resolution_clock::now();
    std::cerr << "[" << name << "] compared in "
              << std::chrono::duration<double, std::milli>(endTime - startTime)
                     .count()
              << " ms" << std::endl;
  }

  return result;
}

std::vector<PairResult>
PdfComparator::compareAll(const std::vector<ComparisonCase> &cases) const {
  std::vector<PairResult> results;
  results.reserve(cases.size());
  for (const auto &testCase : cases) {
    results.push_back(
        compare(testCase.name, testCase.candidatePath, testCase.referencePath));
  }
  return results;
}

void PdfComparator::computeMetrics(PairResult &result,
                                   const DocumentRef &candidate,
                                   const DocumentRef &reference) const {
  result.candidateSize = candidate.size;
  result.referenceSize = reference.size;

  if (m_renderer->isAvailable()) {
    result.candidatePages = probePageCount(candidate.path);
    result.referencePages = probePageCount(reference.path);
  }

  compareText(result, candidate, reference);

  if (m_renderer->isAvailable()) {
    compareVisuals(result, candidate, reference);
  }

  const double pageScore =
      ScoreAggregator::pageScore(result.candidatePages, result.referencePages);
  result.overallScore = ScoreAggregator::aggregate(
      pageScore, *result.textSimilarity, result.visualAverage);
}

void PdfComparator::compareText(PairResult &result,
                                const DocumentRef &candidate,
                                const DocumentRef &reference) const {
  TextExtraction candidateText = m_textExtractor.extract(candidate.path);
  TextExtraction referenceText = m_textExtractor.extract(reference.path);

  // Keep both sides on the same extraction path so the texts are comparable
  if (m_renderer->isAvailable() &&
      (candidateText.usedFallback || referenceText.usedFallback)) {
    // The candidate is extracted first, so its failure is the one reported
    result.textExtractWarning = candidateText.usedFallback
                                    ? candidateText.warning
                                    : referenceText.warning;
    if (!candidateText.usedFallback) {
      candidateText.pages = TextExtractor::extractFallback(candidate.path);
      candidateText.usedFallback = true;
    }
    if (!referenceText.usedFallback) {
      referenceText.pages = TextExtractor::extractFallback(reference.path);
      referenceText.usedFallback = true;
    }
  }

  const std::string flatCandidate = flattenPages(candidateText.pages);
  const std::string flatReference = flattenPages(referenceText.pages);

  const double pageAware = pageAwareSimilarity(flatCandidate, flatReference);
  const double pageAgnostic =
      pageAgnosticSimilarity(flatCandidate, flatReference);

  result.pageAwareTextSimilarity = pageAware;
  result.flatTextSimilarity = pageAgnostic;
  result.textSimilarity = std::max(pageAware, pageAgnostic);

  std::string diff =
      unifiedDiff(flatCandidate, flatReference, "candidate/" + result.name + ".pdf",
                  "reference/" + result.name + ".pdf");
  result.textDiff = diff.empty() ? std::string(policy::kIdenticalMarker) : diff;

  result.candidateText = flatCandidate;
  result.referenceText = flatReference;
}

void PdfComparator::compareVisuals(PairResult &result,
                                   const DocumentRef &candidate,
                                   const DocumentRef &reference) const {
  std::vector<std::optional<PixelBuffer>> candidatePages =
      renderSide(candidate.path, result.candidatePages);
  std::vector<std::optional<PixelBuffer>> referencePages =
      renderSide(reference.path, result.referencePages);

  result.visualScores =
      PixelSimilarity::scorePages(candidatePages, referencePages);
  result.visualAverage = PixelSimilarity::average(result.visualScores);

  if (m_config.savePageImages) {
    PageImageWriter writer(m_config.imagesDir);
    result.pageImages = writer.write(result.name, candidatePages, referencePages);
  }
}

std::optional<int>
PdfComparator::probePageCount(const std::string &pdfPath) const {
  try {
    std::unique_ptr<RenderedDocument> doc = m_renderer->open(pdfPath);
    return doc->pageCount();
  } catch (const RenderError &e) {
    std::cerr << "Cannot count pages of " << pdfPath << ": " << e.what()
              << std::endl;
    return std::nullopt;
  }
}

std::vector<std::optional<PixelBuffer>>
PdfComparator::renderSide(const std::string &pdfPath,
                          const std::optional<int> &pageCount) const {
  if (!pageCount || *pageCount <= 0) {
    return {};
  }

  try {
    return m_rasterizer.renderPages(pdfPath, *pageCount);
  } catch (const RenderError &e) {
    // Unrenderable pages count as absent
    std::cerr << "Cannot render " << pdfPath << ": " << e.what() << std::endl;
    return std::vector<std::optional<PixelBuffer>>(
        static_cast<std::size_t>(*pageCount));
  }
}

} // namespace pdfcmp
