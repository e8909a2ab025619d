/// @file
/// @brief Brute-force neighborhood enumeration with stable ranking.

#include "search/guess_enumerator.h"

#include <algorithm>
#include <utility>

#include "search/offset_counter.h"

namespace combomatic {

uint64_t errorScore(const std::vector<Digit>& digits, const std::vector<Digit>& base,
                    Digit min, Digit modulus) {
  uint64_t total = 0;
  size_t count = std::min(digits.size(), base.size());
  for (size_t idx = 0; idx < count; ++idx) {
    total += ring::ringDistance(digits[idx] - min, base[idx] - min, modulus);
  }
  return total;
}

std::vector<Digit> applyOffsets(const std::vector<Digit>& base,
                                const std::vector<uint64_t>& offsets, Digit range,
                                Digit min, Digit modulus) {
  std::vector<Digit> digits(base.size());
  for (size_t idx = 0; idx < base.size(); ++idx) {
    Digit position = base[idx] - min;
    Digit shifted = ring::ringShift(position, offsets[idx], modulus);
    digits[idx] = ring::ringUnshift(shifted, range, modulus) + min;
  }
  return digits;
}

GuessResult enumerateGuesses(const SearchConfig& config) {
  GuessResult result;

  ValidationResult validation = validateConfig(config);
  if (!validation.success) {
    result.error = validation.error;
    result.error_message = validation.error_message;
    return result;
  }
  result.modulus = validation.modulus;

  const Digit modulus = validation.modulus;
  result.guesses.reserve(validation.candidate_count);

  OffsetCounter counter(config.combination.size(), config.range * 2 + 1);
  do {
    Candidate candidate;
    candidate.digits = applyOffsets(config.combination, counter.offsets(), config.range,
                                    config.min, modulus);
    result.guesses.push_back(std::move(candidate));
  } while (counter.advance());

  for (auto& candidate : result.guesses) {
    candidate.errors = errorScore(candidate.digits, config.combination, config.min, modulus);
  }

  std::stable_sort(result.guesses.begin(), result.guesses.end(),
                   [](const Candidate& lhs, const Candidate& rhs) {
                     return lhs.errors < rhs.errors;
                   });

  result.success = true;
  return result;
}

}  // namespace combomatic
