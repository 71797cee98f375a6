// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file spin_config.hpp
 * @brief Translations and pair classification of spin configurations.
 *
 * A configuration is a u64 word, bit x + nx·y holding the spin of site
 * (x, y). Translations act on whole rows of nx bits:
 *   T_x: (x, y) → (x+1, y)   rotate each row left by one bit
 *   T_y: (x, y) → (x, y−1)   rotate the word right by nx bits
 * Both are closed-form and satisfy T_x^nx = T_y^ny = 1.
 */

#pragma once

#include <trilat/utils/bit_utils.hpp>
#include <trilat/utils/types.hpp>

#include <utility>

namespace trilat {

enum class Axis : u8 { X, Y };

/**
 * Mask of column x (one bit per row).
 */
[[nodiscard]] constexpr u64 column_mask(int x, int nx, int ny) noexcept {
    u64 m = 0;
    for (int y = 0; y < ny; ++y) {
        m |= site_mask<u64>(x + nx * y);
    }
    return m;
}

[[nodiscard]] constexpr u64 translate_x(u64 dec, int nx, int ny) noexcept {
    if (nx == 1) return dec;
    const u64 last = column_mask(nx - 1, nx, ny);
    return ((dec & ~last) << 1) | ((dec & last) >> (nx - 1));
}

[[nodiscard]] constexpr u64 translate_y(u64 dec, int nx, int ny) noexcept {
    if (ny == 1) return dec;
    return (dec >> nx) | ((dec & make_mask<u64>(nx)) << (nx * (ny - 1)));
}

[[nodiscard]] constexpr u64 translate(u64 dec, Axis axis, int nx, int ny) noexcept {
    return axis == Axis::X ? translate_x(dec, nx, ny) : translate_y(dec, nx, ny);
}

/**
 * Classify an anti-aligned pair.
 *
 * @return {updown, downup}: s1 up & s2 down, s1 down & s2 up.
 *         Both false when aligned or s1 == s2.
 */
[[nodiscard]] constexpr std::pair<bool, bool> exchange_spin_flips(
    u64 dec, u64 s1, u64 s2
) noexcept {
    const bool up1 = has_bits(dec, s1);
    const bool up2 = has_bits(dec, s2);
    return {up1 && !up2, !up1 && up2};
}

/**
 * Classify an aligned pair.
 *
 * @return {upup, downdown}
 */
[[nodiscard]] constexpr std::pair<bool, bool> repeated_spins(
    u64 dec, u64 s1, u64 s2
) noexcept {
    const bool up1 = has_bits(dec, s1);
    const bool up2 = has_bits(dec, s2);
    return {up1 && up2, !up1 && !up2};
}

} // namespace trilat
