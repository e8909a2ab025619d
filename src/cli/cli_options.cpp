/// @file
/// @brief Command-line parsing and run routine.

#include "cli/cli_options.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>

#include "output/guess_writer.h"
#include "search/guess_enumerator.h"

namespace combomatic {

namespace {

ParseResult usageError(std::string message) {
  ParseResult result;
  result.status = ParseStatus::Error;
  result.error_message = std::move(message);
  return result;
}

/// @brief Parse the value following a numeric option.
/// @return Empty string on success, otherwise the error message.
std::string parseNumericOption(int argc, const char* const argv[], int& idx, Digit& value) {
  const std::string name = argv[idx];
  if (idx + 1 >= argc) {
    return name + " requires a value";
  }
  if (!parseDigit(argv[++idx], value)) {
    return "invalid value for " + name + ": '" + argv[idx] + "'";
  }
  return std::string();
}

/// @brief Print the run parameters.
void printSummary(std::FILE* err, const SearchConfig& config, size_t guess_count) {
  std::fprintf(err, "combomatic v%s\n", kVersion);
  std::fprintf(err, "Ring:        [%llu, %llu]\n", static_cast<unsigned long long>(config.min),
               static_cast<unsigned long long>(config.max));
  std::fprintf(err, "Range:       %llu\n", static_cast<unsigned long long>(config.range));
  std::fprintf(err, "Combination:");
  for (Digit digit : config.combination) {
    std::fprintf(err, " %llu", static_cast<unsigned long long>(digit));
  }
  std::fprintf(err, "\n");
  std::fprintf(err, "Format:      %s\n", outputFormatToString(config.format));
  std::fprintf(err, "Candidates:  %zu\n", guess_count);
}

}  // namespace

bool parseDigit(const char* text, Digit& value) {
  if (text == nullptr || *text < '0' || *text > '9') {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(text, &end, 10);
  if (errno == ERANGE || end == text || *end != '\0') {
    return false;
  }
  value = static_cast<Digit>(parsed);
  return true;
}

ParseResult parseArgs(int argc, const char* const argv[], CliOptions& opts) {
  for (int idx = 1; idx < argc; ++idx) {
    const char* arg = argv[idx];
    if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
      ParseResult result;
      result.status = ParseStatus::Help;
      return result;
    }
    if (std::strcmp(arg, "--version") == 0) {
      ParseResult result;
      result.status = ParseStatus::Version;
      return result;
    }

    std::string error;
    if (std::strcmp(arg, "--min") == 0) {
      error = parseNumericOption(argc, argv, idx, opts.min);
    } else if (std::strcmp(arg, "--max") == 0) {
      error = parseNumericOption(argc, argv, idx, opts.max);
    } else if (std::strcmp(arg, "--range") == 0) {
      error = parseNumericOption(argc, argv, idx, opts.range);
    } else if (std::strcmp(arg, "--combination") == 0) {
      // Consume values up to the next option.
      while (idx + 1 < argc && std::strncmp(argv[idx + 1], "--", 2) != 0) {
        Digit digit = 0;
        if (!parseDigit(argv[++idx], digit)) {
          error = std::string("invalid combination digit: '") + argv[idx] + "'";
          break;
        }
        opts.combination.push_back(digit);
      }
    } else if (std::strcmp(arg, "--csv") == 0) {
      opts.format = OutputFormat::Csv;
    } else if (std::strcmp(arg, "--json") == 0) {
      opts.format = OutputFormat::Json;
    } else if (std::strcmp(arg, "--format") == 0) {
      if (idx + 1 >= argc) {
        error = "--format requires a value";
      } else if (!outputFormatFromString(argv[++idx], opts.format)) {
        error = std::string("unknown format '") + argv[idx] + "'";
      }
    } else if (std::strcmp(arg, "--verbose") == 0) {
      opts.verbose = true;
    } else {
      error = std::string("unknown argument '") + arg + "'";
    }

    if (!error.empty()) {
      return usageError(std::move(error));
    }
  }
  return ParseResult();
}

SearchConfig buildSearchConfig(const CliOptions& opts) {
  SearchConfig config;
  config.min = opts.min;
  config.max = opts.max;
  config.range = opts.range;
  config.combination = opts.combination;
  config.format = opts.format;
  return config;
}

void printUsage(std::FILE* out) {
  std::fprintf(out, "combomatic - rank nearby combinations of a cyclic dial lock\n\n");
  std::fprintf(out, "Usage: combomatic [options] --combination D1 [D2 ...]\n\n");
  std::fprintf(out, "Options:\n");
  std::fprintf(out, "  --min N            Lowest dial value (default 0)\n");
  std::fprintf(out, "  --max N            Highest dial value (default 99)\n");
  std::fprintf(out, "  --range N          Per-digit search radius (default 2)\n");
  std::fprintf(out, "  --combination D..  Known combination, one value per dial\n");
  std::fprintf(out, "  --csv              CSV output (same as --format csv)\n");
  std::fprintf(out, "  --json             JSON output (same as --format json)\n");
  std::fprintf(out, "  --format FMT       Output format: grouped, csv, json\n");
  std::fprintf(out, "  --verbose          Print search summary to stderr\n");
  std::fprintf(out, "  --version          Show version\n");
  std::fprintf(out, "  --help             Show this help\n");
}

int runCli(int argc, const char* const argv[], std::FILE* out, std::FILE* err) {
  CliOptions opts;
  ParseResult parsed = parseArgs(argc, argv, opts);
  switch (parsed.status) {
    case ParseStatus::Help:
      printUsage(out);
      return 0;
    case ParseStatus::Version:
      std::fprintf(out, "combomatic %s\n", kVersion);
      return 0;
    case ParseStatus::Error:
      std::fprintf(err, "Error: %s\n", parsed.error_message.c_str());
      std::fprintf(err, "Run 'combomatic --help' for usage.\n");
      return 1;
    case ParseStatus::Run:
      break;
  }

  const SearchConfig config = buildSearchConfig(opts);

  GuessResult result = enumerateGuesses(config);
  if (!result.success) {
    std::fprintf(err, "Error: %s\n", result.error_message.c_str());
    return 1;
  }

  if (opts.verbose) {
    printSummary(err, config, result.guesses.size());
  }

  std::string text = renderGuesses(result.guesses, config);
  std::fputs(text.c_str(), out);
  return 0;
}

}  // namespace combomatic
