/// @file
/// @brief JsonWriter implementation.

#include "output/json_writer.h"

#include <cstdio>

namespace combomatic {

void JsonWriter::beginObject() { open('{'); }

void JsonWriter::endObject() { close('}'); }

void JsonWriter::beginArray() { open('['); }

void JsonWriter::endArray() { close(']'); }

void JsonWriter::key(std::string_view name) {
  beforeElement();
  buffer_ += '"';
  buffer_ += escapeString(name);
  buffer_ += "\":";
  // The value that follows belongs to this key and takes no comma.
  if (!needs_comma_.empty()) {
    needs_comma_.back() = false;
  }
}

void JsonWriter::value(uint64_t val) {
  beforeElement();
  buffer_ += std::to_string(val);
  afterElement();
}

void JsonWriter::open(char bracket) {
  beforeElement();
  buffer_ += bracket;
  needs_comma_.push_back(false);
}

void JsonWriter::close(char bracket) {
  buffer_ += bracket;
  if (!needs_comma_.empty()) {
    needs_comma_.pop_back();
  }
  afterElement();
}

void JsonWriter::beforeElement() {
  if (!needs_comma_.empty() && needs_comma_.back()) {
    buffer_ += ',';
    needs_comma_.back() = false;
  }
}

void JsonWriter::afterElement() {
  if (!needs_comma_.empty()) {
    needs_comma_.back() = true;
  }
}

std::string JsonWriter::escapeString(std::string_view input) {
  std::string result;
  result.reserve(input.size());

  for (char chr : input) {
    switch (chr) {
      case '"':  result += "\\\""; break;
      case '\\': result += "\\\\"; break;
      case '\n': result += "\\n";  break;
      case '\r': result += "\\r";  break;
      case '\t': result += "\\t";  break;
      default:
        if (static_cast<unsigned char>(chr) < 0x20) {
          char hex_buf[8];
          std::snprintf(hex_buf, sizeof(hex_buf), "\\u%04x",
                        static_cast<unsigned>(static_cast<unsigned char>(chr)));
          result += hex_buf;
        } else {
          result += chr;
        }
        break;
    }
  }

  return result;
}

}  // namespace combomatic
