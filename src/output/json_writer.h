// Minimal JSON string builder (no external dependencies).
//
// Write-only: used for the --json rendering of guess lists, which holds only
// keys, arrays and unsigned integers.

#ifndef COMBOMATIC_OUTPUT_JSON_WRITER_H
#define COMBOMATIC_OUTPUT_JSON_WRITER_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace combomatic {

/// @brief Incremental JSON writer with automatic comma placement.
///
/// Usage:
/// @code
///   JsonWriter writer;
///   writer.beginObject();
///   writer.key("errors");
///   writer.value(uint64_t{2});
///   writer.endObject();
///   // writer.toString() -> {"errors":2}
/// @endcode
///
/// Does not validate structure (caller must match begin/end pairs).
class JsonWriter {
 public:
  JsonWriter() = default;

  void beginObject();
  void endObject();
  void beginArray();
  void endArray();

  /// @brief Write an object key, JSON-escaped (must be followed by a value).
  void key(std::string_view name);

  /// @brief Write an unsigned integer value. Digits are full 64-bit.
  void value(uint64_t val);

  /// @brief Accumulated JSON text.
  const std::string& toString() const { return buffer_; }

 private:
  void open(char bracket);
  void close(char bracket);

  /// Insert the separating comma before a key or value if one is pending.
  void beforeElement();

  /// Mark the current container as holding at least one element.
  void afterElement();

  static std::string escapeString(std::string_view input);

  std::string buffer_;

  // One entry per open container: true once an element has been written.
  std::vector<bool> needs_comma_;
};

}  // namespace combomatic

#endif  // COMBOMATIC_OUTPUT_JSON_WRITER_H
