// Text renderers for ranked guess lists: CSV rows, grouped listing, JSON.

#ifndef COMBOMATIC_OUTPUT_GUESS_WRITER_H
#define COMBOMATIC_OUTPUT_GUESS_WRITER_H

#include <string>
#include <vector>

#include "search/guess_enumerator.h"
#include "search/search_config.h"

namespace combomatic {

/// @brief Render guesses as CSV with an empty leading "tried" column.
///
/// Header: tried,number 1,...,number k,errors
/// Rows:   ,d1,...,dk,errors
///
/// The column count is taken from the first candidate.
/// @param guesses Ranked candidates.
/// @return CSV text, or an empty string when guesses is empty.
std::string writeCsv(const std::vector<Candidate>& guesses);

/// @brief Render guesses grouped by error count.
///
/// A "<n> errors:" header opens each run of equal error counts; each
/// candidate follows on its own line with digits zero-padded to the decimal
/// width of max and joined by '-':
/// @code
///   0 errors:
///   00-01
///   1 errors:
///   99-01
/// @endcode
/// @param guesses Ranked candidates (groups are contiguous when sorted).
/// @param max Highest ring value, sets the padding width.
/// @return Grouped text.
std::string writeGrouped(const std::vector<Candidate>& guesses, Digit max);

/// @brief Render the search parameters and guesses as one JSON object.
/// @param guesses Ranked candidates.
/// @param config Configuration the guesses were generated from.
/// @return Compact JSON text.
std::string writeJson(const std::vector<Candidate>& guesses, const SearchConfig& config);

/// @brief Dispatch to the renderer selected by config.format.
std::string renderGuesses(const std::vector<Candidate>& guesses, const SearchConfig& config);

}  // namespace combomatic

#endif  // COMBOMATIC_OUTPUT_GUESS_WRITER_H
