#include "ComparisonReport.hpp"
#include "DocumentRenderer.hpp"
#include "PdfComparator.hpp"

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " [options]\n"
      << "\nOptions:\n"
      << "  -c, --candidate-dir <dir>  Generated PDFs (default: candidate_pdfs)\n"
      << "  -r, --reference-dir <dir>  Reference PDFs (default: reference_pdfs)\n"
      << "  -o, --report-dir <dir>     Report output (default: reports)\n"
      << "  -d, --dpi <val>            Rendering resolution (default: 150)\n"
      << "      --no-render            Skip rendering; scrape text from raw "
         "PDF bytes\n"
      << "      --no-images            Do not save per-page PNG renderings\n"
      << "  -v, --verbose              Log per-case progress\n"
      << "  -h, --help                 Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " -c out/pdf -r ref/pdf\n"
      << "  " << programName << " --no-render -o reports/text_only\n";
}

// Union of the *.pdf stems found in both directories, sorted
std::set<std::string> collectCaseNames(const std::string &candidateDir,
                                       const std::string &referenceDir) {
  std::set<std::string> names;
  for (const auto &dir : {candidateDir, referenceDir}) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
      continue;
    }
    for (const auto &entry : fs::directory_iterator(dir, ec)) {
      if (entry.is_regular_file(ec) && entry.path().extension() == ".pdf") {
        names.insert(entry.path().stem().string());
      }
    }
  }
  return names;
}

std::string currentTimestamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  std::ostringstream out;
  out << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
  return out.str();
}

int main(int argc, char *argv[]) {
  std::string candidateDir = "candidate_pdfs";
  std::string referenceDir = "reference_pdfs";
  std::string reportDir = "reports";
  bool enableRendering = true;
  pdfcmp::CompareConfig config;
  config.savePageImages = true;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-c" || arg == "--candidate-dir") {
      if (i + 1 < argc) {
        candidateDir = argv[++i];
      } else {
        std::cerr << "Error: --candidate-dir requires an argument\n";
        return 1;
      }
    } else if (arg == "-r" || arg == "--reference-dir") {
      if (i + 1 < argc) {
        referenceDir = argv[++i];
      } else {
        std::cerr << "Error: --reference-dir requires an argument\n";
        return 1;
      }
    } else if (arg == "-o" || arg == "--report-dir") {
      if (i + 1 < argc) {
        reportDir = argv[++i];
      } else {
        std::cerr << "Error: --report-dir requires an argument\n";
        return 1;
      }
    } else if (arg == "-d" || arg == "--dpi") {
      if (i + 1 < argc) {
        try {
          config.dpi = std::stod(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --dpi expects a number\n";
          return 1;
        }
        if (config.dpi <= 0) {
          std::cerr << "Error: --dpi must be positive\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --dpi requires an argument\n";
        return 1;
      }
    } else if (arg == "--no-render") {
      enableRendering = false;
    } else if (arg == "--no-images") {
      config.savePageImages = false;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  const std::string candidateRoot = fs::absolute(candidateDir).string();
  const std::string referenceRoot = fs::absolute(referenceDir).string();
  const std::string reportRoot = fs::absolute(reportDir).string();
  config.imagesDir = (fs::path(reportRoot) / "images").string();

  std::cout << "Candidate PDFs:  " << candidateRoot << "\n"
            << "Reference PDFs:  " << referenceRoot << "\n"
            << "Report output:   " << reportRoot << "\n\n";

  std::set<std::string> names = collectCaseNames(candidateRoot, referenceRoot);
  if (names.empty()) {
    std::cerr << "No PDF files found in either directory.\n";
    return 1;
  }

  std::error_code ec;
  fs::create_directories(reportRoot, ec);
  if (ec) {
    std::cerr << "Cannot create report directory " << reportRoot << ": "
              << ec.message() << "\n";
    return 1;
  }

  // The renderer is chosen once and shared by every comparison
  auto renderer = pdfcmp::createRenderer(enableRendering);
  if (renderer->isAvailable()) {
    std::cout << "Poppler version: "
              << pdfcmp::PopplerRenderer::getPopplerVersion() << "\n\n";
  }

  pdfcmp::PdfComparator comparator(renderer, config);

  std::vector<pdfcmp::PairResult> results;
  results.reserve(names.size());
  for (const auto &name : names) {
    std::cout << "Comparing: " << name << " ... " << std::flush;
    pdfcmp::PairResult result = comparator.compare(
        name, (fs::path(candidateRoot) / (name + ".pdf")).string(),
        (fs::path(referenceRoot) / (name + ".pdf")).string());
    std::cout << "score="
              << pdfcmp::ComparisonReport::formatScore(result.overallScore)
              << "\n";
    results.push_back(std::move(result));
  }

  pdfcmp::ComparisonReport report(std::move(results));

  const std::string markdownPath =
      (fs::path(reportRoot) / "comparison_report.md").string();
  const std::string jsonPath =
      (fs::path(reportRoot) / "comparison_report.json").string();
  try {
    report.writeJson(jsonPath);
    report.writeMarkdown(markdownPath, currentTimestamp());
  } catch (const std::exception &e) {
    std::cerr << "Error writing reports: " << e.what() << "\n";
    return 1;
  }

  std::cout << "\nReports saved:\n"
            << "  Markdown: " << markdownPath << "\n"
            << "  JSON:     " << jsonPath << "\n";

  const pdfcmp::ReportSummary &summary = report.summary();
  std::cout << "\n" << std::string(60, '=') << "\n"
            << "Overall Average Score: " << std::fixed << std::setprecision(4)
            << summary.averageScore << "\n"
            << std::string(60, '=') << "\n";

  if (summary.averageScore < pdfcmp::policy::kFairScoreThreshold) {
    std::cout << "Many test cases are significantly different from the "
                 "reference.\n"
              << "  Check the report for details and improvement "
                 "suggestions.\n";
  }

  return 0;
}
