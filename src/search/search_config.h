// Search configuration and error reporting for combination enumeration.

#ifndef COMBOMATIC_SEARCH_SEARCH_CONFIG_H
#define COMBOMATIC_SEARCH_SEARCH_CONFIG_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/ring.h"

namespace combomatic {

/// Upper bound on materialized digits, candidates times positions (2^22).
/// Keeps the guess list and its rendered text within a few hundred MB.
constexpr uint64_t kMaxSearchDigits = uint64_t{1} << 22;

/// @brief Output rendering mode selected on the command line.
enum class OutputFormat : uint8_t {
  Grouped,  ///< Human-readable, one block per error count (default).
  Csv,      ///< Tabular spreadsheet rows.
  Json      ///< Single JSON document.
};

/// @brief Convert OutputFormat to its command-line name.
const char* outputFormatToString(OutputFormat format);

/// @brief Parse an OutputFormat from its command-line name.
/// @param str "grouped", "csv" or "json".
/// @param format Output: parsed value, untouched on failure.
/// @return False for unrecognized names.
bool outputFormatFromString(const std::string& str, OutputFormat& format);

/// @brief Configuration failures. None are retried.
enum class SearchError : uint8_t {
  None = 0,
  InvalidRingBounds,
  EmptyCombination,
  DigitOutOfRange,
  SearchSpaceOverflow
};

/// @brief Convert SearchError to a stable identifier string.
const char* searchErrorToString(SearchError error);

/// @brief Immutable description of one search run.
struct SearchConfig {
  Digit min = 0;
  Digit max = 99;
  Digit range = 2;                  ///< Per-digit radius, same for all positions.
  std::vector<Digit> combination;   ///< Known base combination (required).
  OutputFormat format = OutputFormat::Grouped;
};

/// @brief Outcome of validating a SearchConfig.
struct ValidationResult {
  bool success = false;
  SearchError error = SearchError::None;
  std::string error_message;
  Digit modulus = 0;           ///< Ring size (valid on success).
  uint64_t candidate_count = 0;  ///< (2 * range + 1) ^ positions (valid on success).
};

/// @brief Compute (2 * range + 1) ^ positions with overflow detection.
/// @param range Per-digit radius.
/// @param positions Number of digits in the combination.
/// @param count Output: number of candidates, untouched on failure.
/// @return False if count * positions exceeds kMaxSearchDigits.
bool candidateCount(Digit range, size_t positions, uint64_t& count);

/// @brief Check a configuration before enumeration.
///
/// Checks, in order: ring bounds, empty combination, each digit inside
/// [min, max], then the size of the search space.
///
/// @param config Configuration to check.
/// @return ValidationResult with derived modulus and candidate count.
ValidationResult validateConfig(const SearchConfig& config);

}  // namespace combomatic

#endif  // COMBOMATIC_SEARCH_SEARCH_CONFIG_H
