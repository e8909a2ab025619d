/// @file
/// @brief CSV, grouped and JSON renderers for guess lists.

#include "output/guess_writer.h"

#include "core/ring.h"
#include "output/json_writer.h"

namespace combomatic {

namespace {

/// @brief Format a digit left-padded with zeros to the given width.
std::string padDigit(Digit digit, size_t width) {
  std::string text = std::to_string(digit);
  if (text.size() < width) {
    text.insert(0, width - text.size(), '0');
  }
  return text;
}

void writeDigitArray(JsonWriter& writer, const std::vector<Digit>& digits) {
  writer.beginArray();
  for (Digit digit : digits) {
    writer.value(uint64_t{digit});
  }
  writer.endArray();
}

}  // namespace

std::string writeCsv(const std::vector<Candidate>& guesses) {
  std::string out;
  if (guesses.empty()) {
    return out;
  }

  const size_t positions = guesses.front().digits.size();

  out += "tried";
  for (size_t idx = 0; idx < positions; ++idx) {
    out += ",number " + std::to_string(idx + 1);
  }
  out += ",errors\n";

  for (const auto& candidate : guesses) {
    for (Digit digit : candidate.digits) {
      out += ',';
      out += std::to_string(digit);
    }
    out += ',';
    out += std::to_string(candidate.errors);
    out += '\n';
  }
  return out;
}

std::string writeGrouped(const std::vector<Candidate>& guesses, Digit max) {
  std::string out;
  const size_t width = ring::decimalWidth(max);

  bool first = true;
  uint64_t current_errors = 0;
  for (const auto& candidate : guesses) {
    if (first || candidate.errors != current_errors) {
      out += std::to_string(candidate.errors) + " errors:\n";
      current_errors = candidate.errors;
      first = false;
    }

    for (size_t idx = 0; idx < candidate.digits.size(); ++idx) {
      if (idx > 0) {
        out += '-';
      }
      out += padDigit(candidate.digits[idx], width);
    }
    out += '\n';
  }
  return out;
}

std::string writeJson(const std::vector<Candidate>& guesses, const SearchConfig& config) {
  JsonWriter writer;
  writer.beginObject();

  writer.key("min");
  writer.value(uint64_t{config.min});
  writer.key("max");
  writer.value(uint64_t{config.max});
  writer.key("range");
  writer.value(uint64_t{config.range});
  writer.key("combination");
  writeDigitArray(writer, config.combination);
  writer.key("count");
  writer.value(static_cast<uint64_t>(guesses.size()));

  writer.key("guesses");
  writer.beginArray();
  for (const auto& candidate : guesses) {
    writer.beginObject();
    writer.key("digits");
    writeDigitArray(writer, candidate.digits);
    writer.key("errors");
    writer.value(candidate.errors);
    writer.endObject();
  }
  writer.endArray();

  writer.endObject();
  return writer.toString() + "\n";
}

std::string renderGuesses(const std::vector<Candidate>& guesses, const SearchConfig& config) {
  switch (config.format) {
    case OutputFormat::Csv:
      return writeCsv(guesses);
    case OutputFormat::Json:
      return writeJson(guesses, config);
    case OutputFormat::Grouped:
      break;
  }
  return writeGrouped(guesses, config.max);
}

}  // namespace combomatic
