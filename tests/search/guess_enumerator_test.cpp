// Tests for search/guess_enumerator.h -- neighborhood generation and ranking.

#include "search/guess_enumerator.h"

#include <gtest/gtest.h>

#include <utility>
#include <vector>

namespace combomatic {
namespace {

SearchConfig makeConfig(Digit min, Digit max, Digit range, std::vector<Digit> combination) {
  SearchConfig config;
  config.min = min;
  config.max = max;
  config.range = range;
  config.combination = std::move(combination);
  return config;
}

std::vector<std::vector<Digit>> digitsOf(const GuessResult& result) {
  std::vector<std::vector<Digit>> out;
  for (const auto& candidate : result.guesses) {
    out.push_back(candidate.digits);
  }
  return out;
}

// ---------------------------------------------------------------------------
// errorScore / applyOffsets
// ---------------------------------------------------------------------------

TEST(ErrorScoreTest, SumsPerPositionRingDistance) {
  EXPECT_EQ(errorScore({0, 1}, {0, 1}, 0, 100), 0u);
  EXPECT_EQ(errorScore({99, 2}, {0, 1}, 0, 100), 2u);
  EXPECT_EQ(errorScore({40, 1}, {1, 40}, 1, 40), 2u);
  EXPECT_EQ(errorScore({50, 0}, {0, 50}, 0, 100), 100u);
}

TEST(ApplyOffsetsTest, CenterOffsetIsIdentity) {
  EXPECT_EQ(applyOffsets({5, 17}, {2, 2}, 2, 0, 100), (std::vector<Digit>{5, 17}));
}

TEST(ApplyOffsetsTest, LowAndHighOffsetsWrap) {
  // Offset 0 means "digit - range", offset 2 * range means "digit + range".
  EXPECT_EQ(applyOffsets({0, 99}, {0, 2}, 1, 0, 100), (std::vector<Digit>{99, 0}));
}

TEST(ApplyOffsetsTest, RespectsNonZeroMin) {
  EXPECT_EQ(applyOffsets({1, 40}, {0, 2}, 1, 1, 40), (std::vector<Digit>{40, 1}));
}

// ---------------------------------------------------------------------------
// enumerateGuesses
// ---------------------------------------------------------------------------

TEST(EnumerateGuessesTest, RangeZeroReturnsBaseOnly) {
  GuessResult result = enumerateGuesses(makeConfig(0, 99, 0, {0, 1, 2}));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.guesses.size(), 1u);
  EXPECT_EQ(result.guesses[0].digits, (std::vector<Digit>{0, 1, 2}));
  EXPECT_EQ(result.guesses[0].errors, 0u);
}

TEST(EnumerateGuessesTest, SingleDigitSmallRing) {
  GuessResult result = enumerateGuesses(makeConfig(0, 9, 0, {5}));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.guesses.size(), 1u);
  EXPECT_EQ(result.guesses[0].digits, (std::vector<Digit>{5}));
  EXPECT_EQ(result.guesses[0].errors, 0u);
}

TEST(EnumerateGuessesTest, RangeOneSingleDigit) {
  GuessResult result = enumerateGuesses(makeConfig(0, 99, 1, {0}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.guesses.size(), 3u);
  EXPECT_EQ(result.modulus, 100u);
}

TEST(EnumerateGuessesTest, RangeOneTwoDigits) {
  GuessResult result = enumerateGuesses(makeConfig(0, 99, 1, {0, 1}));
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.guesses.size(), 9u);
}

TEST(EnumerateGuessesTest, RankedOrderWithStableTies) {
  GuessResult result = enumerateGuesses(makeConfig(0, 99, 1, {0, 1}));
  ASSERT_TRUE(result.success);

  // Ties keep generation order, where the first digit turns fastest.
  std::vector<std::vector<Digit>> expected = {
      {0, 1},
      {0, 0}, {99, 1}, {1, 1}, {0, 2},
      {99, 0}, {1, 0}, {99, 2}, {1, 2}};
  EXPECT_EQ(digitsOf(result), expected);

  std::vector<uint64_t> errors;
  for (const auto& candidate : result.guesses) {
    errors.push_back(candidate.errors);
  }
  EXPECT_EQ(errors, (std::vector<uint64_t>{0, 1, 1, 1, 1, 2, 2, 2, 2}));
}

TEST(EnumerateGuessesTest, CountMatchesPowerAndDigitsStayOnRing) {
  struct Case {
    Digit min, max, range;
    std::vector<Digit> combination;
    size_t expected;
  };
  std::vector<Case> cases = {
      {0, 99, 2, {10, 20, 30}, 125},
      {1, 40, 3, {1, 40}, 49},
      {0, 4, 1, {0, 4, 2, 1}, 81},
      {10, 12, 2, {10, 12}, 25},
  };
  for (const auto& test_case : cases) {
    GuessResult result = enumerateGuesses(
        makeConfig(test_case.min, test_case.max, test_case.range, test_case.combination));
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.guesses.size(), test_case.expected);
    for (size_t idx = 0; idx < result.guesses.size(); ++idx) {
      const auto& candidate = result.guesses[idx];
      ASSERT_EQ(candidate.digits.size(), test_case.combination.size());
      for (Digit digit : candidate.digits) {
        EXPECT_GE(digit, test_case.min);
        EXPECT_LE(digit, test_case.max);
      }
      if (idx > 0) {
        EXPECT_LE(result.guesses[idx - 1].errors, candidate.errors);
      }
    }
  }
}

TEST(EnumerateGuessesTest, WraparoundDuplicatesAreKept) {
  // Five offsets on a three-position ring revisit values.
  GuessResult result = enumerateGuesses(makeConfig(0, 2, 2, {0}));
  ASSERT_TRUE(result.success);
  std::vector<std::vector<Digit>> expected = {{0}, {1}, {2}, {1}, {2}};
  EXPECT_EQ(digitsOf(result), expected);
}

TEST(EnumerateGuessesTest, SizeOneRing) {
  GuessResult result = enumerateGuesses(makeConfig(7, 7, 1, {7}));
  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.guesses.size(), 3u);
  for (const auto& candidate : result.guesses) {
    EXPECT_EQ(candidate.digits, (std::vector<Digit>{7}));
    EXPECT_EQ(candidate.errors, 0u);
  }
}

TEST(EnumerateGuessesTest, DeterministicAcrossRuns) {
  SearchConfig config = makeConfig(0, 39, 2, {3, 38, 20});
  GuessResult first = enumerateGuesses(config);
  GuessResult second = enumerateGuesses(config);
  EXPECT_EQ(digitsOf(first), digitsOf(second));
}

TEST(EnumerateGuessesTest, ErrorsReported) {
  GuessResult bounds = enumerateGuesses(makeConfig(10, 0, 1, {5}));
  EXPECT_FALSE(bounds.success);
  EXPECT_EQ(bounds.error, SearchError::InvalidRingBounds);
  EXPECT_TRUE(bounds.guesses.empty());

  GuessResult empty = enumerateGuesses(makeConfig(0, 99, 1, {}));
  EXPECT_EQ(empty.error, SearchError::EmptyCombination);

  GuessResult out_of_range = enumerateGuesses(makeConfig(0, 99, 1, {100}));
  EXPECT_EQ(out_of_range.error, SearchError::DigitOutOfRange);

  GuessResult overflow = enumerateGuesses(makeConfig(0, 99, 50, {1, 2, 3, 4, 5}));
  EXPECT_EQ(overflow.error, SearchError::SearchSpaceOverflow);
  EXPECT_FALSE(overflow.error_message.empty());
}

}  // namespace
}  // namespace combomatic
