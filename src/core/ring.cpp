/// @file
/// @brief Modular arithmetic on the inclusive dial ring.

#include "core/ring.h"

#include <algorithm>
#include <limits>

namespace combomatic {
namespace ring {

bool ringModulus(Digit min, Digit max, Digit& modulus) {
  if (min > max) {
    return false;
  }
  Digit span = max - min;
  if (span == std::numeric_limits<Digit>::max()) {
    return false;
  }
  modulus = span + 1;
  return true;
}

Digit ringDistance(Digit lhs, Digit rhs, Digit modulus) {
  if (modulus <= 1) {
    return 0;
  }
  lhs %= modulus;
  rhs %= modulus;
  Digit forward = lhs >= rhs ? lhs - rhs : rhs - lhs;
  // Going the other way around covers the remainder of the ring.
  return std::min(forward, modulus - forward);
}

Digit ringShift(Digit value, Digit offset, Digit modulus) {
  if (modulus <= 1) {
    return 0;
  }
  offset %= modulus;
  // value + offset may exceed 64 bits when modulus is large.
  if (value >= modulus - offset) {
    return value - (modulus - offset);
  }
  return value + offset;
}

Digit ringUnshift(Digit value, Digit offset, Digit modulus) {
  if (modulus <= 1) {
    return 0;
  }
  offset %= modulus;
  return ringShift(value, modulus - offset, modulus);
}

size_t decimalWidth(Digit value) {
  size_t width = 1;
  while (value >= 10) {
    value /= 10;
    ++width;
  }
  return width;
}

}  // namespace ring
}  // namespace combomatic
