// Neighborhood enumeration and ranking -- every combination within the
// configured radius of a base combination, sorted by distance.

#ifndef COMBOMATIC_SEARCH_GUESS_ENUMERATOR_H
#define COMBOMATIC_SEARCH_GUESS_ENUMERATOR_H

#include <cstdint>
#include <string>
#include <vector>

#include "core/ring.h"
#include "search/search_config.h"

namespace combomatic {

/// @brief One generated combination and its distance from the base.
struct Candidate {
  std::vector<Digit> digits;
  uint64_t errors = 0;  ///< Sum of per-position ring distances to the base.
};

/// @brief Result of enumerating a search configuration.
struct GuessResult {
  std::vector<Candidate> guesses;  ///< Ascending by errors, ties in generation order.
  bool success = false;
  SearchError error = SearchError::None;
  std::string error_message;
  Digit modulus = 0;
};

/// @brief Sum of ring distances between a candidate and the base combination.
/// @param digits Candidate digits in [min, max].
/// @param base Base combination in [min, max], same length as digits.
/// @param min Lowest ring value.
/// @param modulus Ring size.
/// @return Error score. Extra positions in the longer sequence are ignored.
uint64_t errorScore(const std::vector<Digit>& digits, const std::vector<Digit>& base,
                    Digit min, Digit modulus);

/// @brief Map a zero-based offset tuple to a candidate combination.
///
/// Offset value d at a position means a true offset of (d - range): 0 is
/// "base digit minus range", 2 * range is "base digit plus range".
///
/// @param base Base combination in [min, max].
/// @param offsets Offset tuple, same length as base.
/// @param range Per-digit radius.
/// @param min Lowest ring value.
/// @param modulus Ring size.
/// @return Candidate digits, each in [min, min + modulus).
std::vector<Digit> applyOffsets(const std::vector<Digit>& base,
                                const std::vector<uint64_t>& offsets, Digit range,
                                Digit min, Digit modulus);

/// @brief Enumerate and rank the full neighborhood of config.combination.
///
/// Produces exactly (2 * range + 1) ^ positions candidates in counter order,
/// scores each one after generation, then stable-sorts by score. Nothing is
/// deduplicated: with range * 2 + 1 > modulus, wraparound yields repeated
/// combinations and all of them are kept.
///
/// @param config Search configuration, validated here.
/// @return GuessResult; on failure guesses is empty and error is set.
GuessResult enumerateGuesses(const SearchConfig& config);

}  // namespace combomatic

#endif  // COMBOMATIC_SEARCH_GUESS_ENUMERATOR_H
