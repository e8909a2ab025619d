// Mixed-radix counter producing per-position offset tuples in enumeration
// order (least-significant position first).

#ifndef COMBOMATIC_SEARCH_OFFSET_COUNTER_H
#define COMBOMATIC_SEARCH_OFFSET_COUNTER_H

#include <cstddef>
#include <cstdint>
#include <vector>

namespace combomatic {

/// @brief Odometer over [0, radix)^positions.
///
/// Usage:
/// @code
///   OffsetCounter counter(2, 3);
///   do {
///     use(counter.offsets());  // {0,0}, {1,0}, {2,0}, {0,1}, ... {2,2}
///   } while (counter.advance());
/// @endcode
///
/// Position 0 turns fastest, so tuple number n is the base-radix expansion of
/// n with its least-significant digit first.
class OffsetCounter {
 public:
  /// @param positions Tuple length.
  /// @param radix Distinct values per position (0 is treated as 1).
  OffsetCounter(size_t positions, uint64_t radix);

  /// @brief Current tuple, each entry in [0, radix).
  const std::vector<uint64_t>& offsets() const { return offsets_; }

  /// @brief Step to the next tuple.
  /// @return False once the counter wraps back to all zeros.
  bool advance();

 private:
  std::vector<uint64_t> offsets_;
  uint64_t radix_;
};

}  // namespace combomatic

#endif  // COMBOMATIC_SEARCH_OFFSET_COUNTER_H
