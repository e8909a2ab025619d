// Cyclic number ring utilities -- modulus computation, overflow-safe
// modular shifting, and minimal cyclic distance between ring positions.

#ifndef COMBOMATIC_CORE_RING_H
#define COMBOMATIC_CORE_RING_H

#include <cstddef>
#include <cstdint>

namespace combomatic {

/// Digit value on a ring (dial position).
using Digit = uint64_t;

namespace ring {

/// @brief Compute the number of positions on the inclusive ring [min, max].
/// @param min Lowest dial value (inclusive).
/// @param max Highest dial value (inclusive).
/// @param modulus Output: max - min + 1 on success, untouched on failure.
/// @return False if min > max or the size does not fit in 64 bits
///         (min = 0, max = UINT64_MAX).
bool ringModulus(Digit min, Digit max, Digit& modulus);

/// @brief Minimal number of single steps between two ring positions.
/// @param lhs Zero-based position in [0, modulus).
/// @param rhs Zero-based position in [0, modulus).
/// @param modulus Ring size, at least 1.
/// @return min((lhs - rhs) mod modulus, (rhs - lhs) mod modulus).
///
/// Symmetric, zero for equal positions, never larger than modulus / 2.
/// A ring of size 1 always yields 0.
Digit ringDistance(Digit lhs, Digit rhs, Digit modulus);

/// @brief Add an offset to a zero-based ring position with wraparound.
/// @param value Zero-based position in [0, modulus).
/// @param offset Any offset; reduced modulo modulus first.
/// @param modulus Ring size, at least 1.
/// @return (value + offset) mod modulus, computed without overflow.
Digit ringShift(Digit value, Digit offset, Digit modulus);

/// @brief Move a zero-based ring position backwards with wraparound.
/// @return (value - offset) mod modulus, computed without overflow.
Digit ringUnshift(Digit value, Digit offset, Digit modulus);

/// @brief Number of decimal characters needed to print a value.
/// @param value Any digit value (0 prints as "0", width 1).
size_t decimalWidth(Digit value);

}  // namespace ring
}  // namespace combomatic

#endif  // COMBOMATIC_CORE_RING_H
