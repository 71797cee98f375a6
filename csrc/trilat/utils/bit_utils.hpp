// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bit_utils.hpp
 * @brief Bit manipulation for spin configuration words.
 *
 * Bit i (LSB=0) of a configuration is the spin on site i (1 = up).
 * Single-site operands are passed as one-bit masks.
 */

#pragma once

#include "types.hpp"
#include <bit>
#include <concepts>

namespace trilat {

// ============================================================================
// Bit Counting and Scanning
// ============================================================================

/**
 * Count set bits (population count).
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr int popcount(T x) noexcept {
    return static_cast<int>(std::popcount(x));
}

/**
 * Count trailing zeros (lowest set bit position).
 * Returns sizeof(T)*8 if x == 0.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr int ctz(T x) noexcept {
    return static_cast<int>(std::countr_zero(x));
}

// ============================================================================
// Bit Manipulation
// ============================================================================

/**
 * Isolate lowest set bit: x & -x.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T isolate_lsb(T x) noexcept {
    return x & (~x + 1);
}

/**
 * True if every bit of mask is set in x (site(s) spin-up).
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr bool has_bits(T x, T mask) noexcept {
    return (x | mask) == x;
}

/**
 * One-bit mask for site index pos.
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T site_mask(int pos) noexcept {
    return T{1} << pos;
}

// ============================================================================
// Bitmask Utilities
// ============================================================================

/**
 * Create mask with n lowest bits set.
 * Example: make_mask(3) = 0b111
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T make_mask(int n) noexcept {
    if (n <= 0) return 0;
    if (n >= static_cast<int>(sizeof(T) * 8)) return ~T{0};
    return (T{1} << n) - 1;
}

/**
 * Next word with the same popcount (Gosper's hack).
 *
 * x' = ((x ⊕ r) ≫ 2) / c | r, with c = lsb(x), r = x + c.
 * Caller detects termination (overflow past the lattice width).
 */
template<std::unsigned_integral T>
[[nodiscard]] constexpr T next_combination(T x) noexcept {
    const T c = isolate_lsb(x);
    const T r = x + c;
    return (((x ^ r) >> 2) / c) | r;
}

} // namespace trilat
