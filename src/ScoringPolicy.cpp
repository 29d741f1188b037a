#include "ScoringPolicy.hpp"

#include <cstdio>
#include <cstdlib>

namespace pdfcmp {

double roundScore(double value) {
  // printf rounds the exact binary value, ties to even
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", policy::kScoreDecimals, value);
  return std::strtod(buffer, nullptr);
}

} // namespace pdfcmp
