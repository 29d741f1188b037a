#include "ComparisonReport.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace pdfcmp {

using json = nlohmann::json;

namespace {

std::string pagesLabel(const std::optional<int> &pages) {
  return pages ? std::to_string(*pages) : std::string("?");
}

std::string scoreLabel(const std::optional<double> &score) {
  return score ? ComparisonReport::formatScore(*score) : std::string("N/A");
}

json pagesJson(const std::optional<int> &pages) {
  return pages ? json(*pages) : json("?");
}

json imageJson(const std::optional<std::string> &image) {
  return image ? json(*image) : json(nullptr);
}

void writeFile(const std::string &path, const std::string &content) {
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("Cannot open report file for writing: " + path);
  }
  file << content;
  if (!file) {
    throw std::runtime_error("Failed to write report file: " + path);
  }
}

} // namespace

ComparisonReport::ComparisonReport(std::vector<PairResult> results)
    : m_results(std::move(results)), m_summary(summarize(m_results)) {}

ReportSummary
ComparisonReport::summarize(const std::vector<PairResult> &results) {
  ReportSummary summary;
  summary.total = results.size();

  double sum = 0.0;
  for (const auto &result : results) {
    sum += result.overallScore;
    if (result.error) {
      summary.errors++;
    }
    if (result.overallScore < policy::kLowScoreThreshold) {
      summary.needsAttention++;
      summary.lowScores.push_back({result.name, result.overallScore});
    } else {
      summary.passing++;
    }
  }

  if (!results.empty()) {
    summary.averageScore = sum / static_cast<double>(results.size());
  }

  std::stable_sort(summary.lowScores.begin(), summary.lowScores.end(),
                   [](const LowScoreCase &lhs, const LowScoreCase &rhs) {
                     return lhs.score < rhs.score;
                   });

  return summary;
}

std::string ComparisonReport::tierMarker(double score) {
  if (score >= policy::kGoodScoreThreshold) {
    return "\xF0\x9F\x9F\xA2"; // green circle
  }
  if (score >= policy::kFairScoreThreshold) {
    return "\xF0\x9F\x9F\xA1"; // yellow circle
  }
  return "\xF0\x9F\x94\xB4"; // red circle
}

std::string ComparisonReport::formatScore(double score) {
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%.*f", policy::kScoreDecimals, score);

  std::string text(buffer);
  std::size_t point = text.find('.');
  if (point != std::string::npos) {
    std::size_t last = text.find_last_not_of('0');
    // keep at least one digit after the point
    text.erase(std::max(last, point + 1) + 1);
  }
  return text;
}

json ComparisonReport::toJson(const PairResult &result) {
  json entry;
  entry["name"] = result.name;
  entry["candidate_exists"] = result.candidateExists;
  entry["reference_exists"] = result.referenceExists;

  if (result.error) {
    entry["error"] = *result.error;
  }

  if (result.candidateSize) {
    entry["candidate_size"] = *result.candidateSize;
  }
  if (result.referenceSize) {
    entry["reference_size"] = *result.referenceSize;
  }

  if (result.hasMetrics()) {
    entry["candidate_pages"] = pagesJson(result.candidatePages);
    entry["reference_pages"] = pagesJson(result.referencePages);
    entry["candidate_text"] = result.candidateText.value_or("");
    entry["reference_text"] = result.referenceText.value_or("");
    entry["page_aware_text_similarity"] = *result.pageAwareTextSimilarity;
    entry["flat_text_similarity"] = *result.flatTextSimilarity;
    entry["text_similarity"] = *result.textSimilarity;
    entry["text_diff"] = result.textDiff.value_or("");

    if (result.visualAverage) {
      entry["visual_scores"] = result.visualScores;
      entry["visual_avg"] = *result.visualAverage;
    }

    if (!result.pageImages.empty()) {
      json images = json::array();
      for (const auto &page : result.pageImages) {
        json image = {{"page", page.page},
                      {"candidate_img", imageJson(page.candidateImage)},
                      {"reference_img", imageJson(page.referenceImage)}};
        images.push_back(image);
      }
      entry["diff_images"] = images;
    }
  }

  if (result.textExtractWarning) {
    entry["text_extract_warning"] = *result.textExtractWarning;
  }

  entry["overall_score"] = result.overallScore;
  return entry;
}

json ComparisonReport::toJson() const {
  json entries = json::array();
  for (const auto &result : m_results) {
    entries.push_back(toJson(result));
  }
  return entries;
}

std::string ComparisonReport::toMarkdown(const std::string &generatedAt) const {
  std::ostringstream md;

  md << "# Candidate vs Reference PDF Comparison Report\n\n";
  md << "Generated: " << generatedAt << "\n\n";

  // Summary table
  md << "## Summary\n\n";
  md << "| # | Test Case | Text Sim | Visual Avg | Pages (C/R) | Overall |\n";
  md << "|---|-----------|----------|------------|-------------|--------|\n";

  for (std::size_t i = 0; i < m_results.size(); ++i) {
    const PairResult &r = m_results[i];
    const std::string marker =
        r.error ? std::string("\xE2\x9A\xAA") : tierMarker(r.overallScore);

    md << "| " << (i + 1) << " | " << marker << " " << r.name << " | "
       << scoreLabel(r.textSimilarity) << " | " << scoreLabel(r.visualAverage)
       << " | " << pagesLabel(r.candidatePages) << "/"
       << pagesLabel(r.referencePages) << " | **"
       << formatScore(r.overallScore) << "** |\n";
  }

  md << "\n**Average Overall Score: " << std::fixed
     << std::setprecision(policy::kScoreDecimals) << m_summary.averageScore
     << "**\n\n";
  md.unsetf(std::ios::floatfield);

  // Detailed sections
  md << "## Detailed Results\n\n";
  for (const auto &r : m_results) {
    md << "### " << r.name << "\n\n";

    if (r.error) {
      md << "**Error:** " << *r.error << "\n\n";
      continue;
    }

    md << "- **Text Similarity:** " << scoreLabel(r.textSimilarity) << "\n";
    md << "- **Visual Average:** " << scoreLabel(r.visualAverage) << "\n";
    md << "- **Overall Score:** " << formatScore(r.overallScore) << "\n";
    md << "- **Pages:** Candidate=" << pagesLabel(r.candidatePages)
       << ", Reference=" << pagesLabel(r.referencePages) << "\n";
    md << "- **File Size:** Candidate="
       << (r.candidateSize ? std::to_string(*r.candidateSize) : "?")
       << " bytes, Reference="
       << (r.referenceSize ? std::to_string(*r.referenceSize) : "?")
       << " bytes\n\n";

    if (r.textExtractWarning) {
      md << "_Text extraction fell back to raw strings: "
         << *r.textExtractWarning << "_\n\n";
    }

    const std::string diff = r.textDiff.value_or("");
    if (!diff.empty() && diff != policy::kIdenticalMarker) {
      md << "<details><summary>Text Diff</summary>\n\n```diff\n";
      if (diff.size() > policy::kMaxReportDiffChars) {
        md << diff.substr(0, policy::kMaxReportDiffChars);
        md << "\n... (" << (diff.size() - policy::kMaxReportDiffChars)
           << " more characters)\n";
      } else {
        md << diff;
      }
      md << "\n```\n</details>\n\n";
    } else {
      md << "Text content: \xE2\x9C\x85 Identical\n\n";
    }
  }

  // Improvement suggestions
  md << "## Improvement Suggestions\n\n";
  if (!m_summary.lowScores.empty()) {
    md << "The following test cases scored below "
       << formatScore(policy::kLowScoreThreshold) << " and need attention:\n\n";
    for (const auto &low : m_summary.lowScores) {
      md << "1. **" << low.name << "** (score: " << formatScore(low.score)
         << ")\n";
    }
    md << "\nReview the text diffs and visual comparisons above to identify "
          "specific rendering issues.\n";
  } else {
    md << "All test cases scored " << formatScore(policy::kLowScoreThreshold)
       << " or above.\n";
  }

  return md.str();
}

void ComparisonReport::writeJson(const std::string &path) const {
  writeFile(path,
            toJson().dump(2, ' ', false, json::error_handler_t::replace) +
                "\n");
}

void ComparisonReport::writeMarkdown(const std::string &path,
                                     const std::string &generatedAt) const {
  writeFile(path, toMarkdown(generatedAt));
}

} // namespace pdfcmp
