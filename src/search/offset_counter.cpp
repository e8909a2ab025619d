/// @file
/// @brief Mixed-radix offset counter.

#include "search/offset_counter.h"

namespace combomatic {

OffsetCounter::OffsetCounter(size_t positions, uint64_t radix)
    : offsets_(positions, 0), radix_(radix == 0 ? 1 : radix) {}

bool OffsetCounter::advance() {
  for (auto& offset : offsets_) {
    if (++offset < radix_) {
      return true;
    }
    offset = 0;  // carry into the next position
  }
  return false;
}

}  // namespace combomatic
