/// @file
/// @brief SearchConfig validation and search-space sizing.

#include "search/search_config.h"

#include <limits>

namespace combomatic {

const char* outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::Grouped: return "grouped";
    case OutputFormat::Csv:     return "csv";
    case OutputFormat::Json:    return "json";
  }
  return "unknown";
}

bool outputFormatFromString(const std::string& str, OutputFormat& format) {
  if (str == "grouped") {
    format = OutputFormat::Grouped;
  } else if (str == "csv") {
    format = OutputFormat::Csv;
  } else if (str == "json") {
    format = OutputFormat::Json;
  } else {
    return false;
  }
  return true;
}

const char* searchErrorToString(SearchError error) {
  switch (error) {
    case SearchError::None:                return "none";
    case SearchError::InvalidRingBounds:   return "invalid_ring_bounds";
    case SearchError::EmptyCombination:    return "empty_combination";
    case SearchError::DigitOutOfRange:     return "digit_out_of_range";
    case SearchError::SearchSpaceOverflow: return "search_space_overflow";
  }
  return "unknown";
}

bool candidateCount(Digit range, size_t positions, uint64_t& count) {
  constexpr uint64_t kLimit = std::numeric_limits<uint64_t>::max();
  if (range > (kLimit - 1) / 2) {
    return false;
  }
  const uint64_t base = range * 2 + 1;
  const uint64_t width = positions == 0 ? 1 : positions;
  if (width > kMaxSearchDigits) {
    return false;
  }
  // Largest candidate count whose digits still fit under the bound.
  const uint64_t max_count = kMaxSearchDigits / width;

  uint64_t total = 1;
  for (size_t pos = 0; pos < positions; ++pos) {
    if (total > max_count / base) {
      return false;
    }
    total *= base;
  }
  count = total;
  return true;
}

ValidationResult validateConfig(const SearchConfig& config) {
  ValidationResult result;

  if (!ring::ringModulus(config.min, config.max, result.modulus)) {
    result.error = SearchError::InvalidRingBounds;
    result.error_message = "invalid ring bounds: min " + std::to_string(config.min) +
                           ", max " + std::to_string(config.max);
    return result;
  }

  if (config.combination.empty()) {
    result.error = SearchError::EmptyCombination;
    result.error_message = "no combination supplied";
    return result;
  }

  for (size_t idx = 0; idx < config.combination.size(); ++idx) {
    Digit digit = config.combination[idx];
    if (digit < config.min || digit > config.max) {
      result.error = SearchError::DigitOutOfRange;
      result.error_message = "digit " + std::to_string(idx + 1) + " (" +
                             std::to_string(digit) + ") outside [" +
                             std::to_string(config.min) + ", " +
                             std::to_string(config.max) + "]";
      return result;
    }
  }

  if (!candidateCount(config.range, config.combination.size(), result.candidate_count)) {
    result.error = SearchError::SearchSpaceOverflow;
    result.error_message = "search space too large: range " + std::to_string(config.range) +
                           " over " + std::to_string(config.combination.size()) +
                           " digits exceeds " + std::to_string(kMaxSearchDigits) +
                           " materialized digits";
    return result;
  }

  result.success = true;
  return result;
}

}  // namespace combomatic
