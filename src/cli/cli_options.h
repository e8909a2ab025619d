// Command-line parsing and the top-level run routine for the combomatic CLI.

#ifndef COMBOMATIC_CLI_CLI_OPTIONS_H
#define COMBOMATIC_CLI_CLI_OPTIONS_H

#include <cstdio>
#include <string>
#include <vector>

#include "core/ring.h"
#include "search/search_config.h"

namespace combomatic {

constexpr const char* kVersion = "0.1.0";

/// @brief Command-line options parsed from argv.
struct CliOptions {
  Digit min = 0;
  Digit max = 99;
  Digit range = 2;
  std::vector<Digit> combination;  ///< Accumulates over repeated --combination.
  OutputFormat format = OutputFormat::Grouped;
  bool verbose = false;
};

/// @brief What main() should do after parsing.
enum class ParseStatus : uint8_t {
  Run,      ///< Options are complete, run the search.
  Help,     ///< --help / -h was given.
  Version,  ///< --version was given.
  Error     ///< Usage error, see ParseResult::error_message.
};

struct ParseResult {
  ParseStatus status = ParseStatus::Run;
  std::string error_message;
};

/// @brief Parse a complete unsigned decimal integer.
/// @param text Argument text.
/// @param value Output value, untouched on failure.
/// @return False on empty input, sign, trailing characters or overflow.
bool parseDigit(const char* text, Digit& value);

/// @brief Parse command-line arguments into CliOptions.
///
/// Parsing stops at the first --help, --version or usage error. Values are
/// not range-checked here; validateConfig() does that.
///
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param opts Output structure populated with parsed values.
/// @return ParseResult telling the caller whether to run, exit or fail.
ParseResult parseArgs(int argc, const char* const argv[], CliOptions& opts);

/// @brief Build a SearchConfig from parsed CLI options.
SearchConfig buildSearchConfig(const CliOptions& opts);

/// @brief Print usage information.
void printUsage(std::FILE* out);

/// @brief Parse, search and render.
/// @param argc Argument count from main().
/// @param argv Argument vector from main().
/// @param out Destination for rendered guesses, help and version.
/// @param err Destination for "Error: ..." messages and --verbose summary.
/// @return Process exit code: 0 on success, --help or --version, 1 otherwise.
int runCli(int argc, const char* const argv[], std::FILE* out, std::FILE* err);

}  // namespace combomatic

#endif  // COMBOMATIC_CLI_CLI_OPTIONS_H
