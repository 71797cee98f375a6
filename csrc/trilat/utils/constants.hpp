// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file constants.hpp
 * @brief Framework-wide compile-time constants.
 */

#pragma once

#include "types.hpp"
#include <numbers>

namespace trilat {

// ============================================================================
// Lattice Limits
// ============================================================================

/**
 * Maximum lattice sites encodable in a 64-bit configuration word.
 * Site indices: [0, 63]
 */
inline constexpr int MAX_SITES_U64 = 64;

/**
 * Largest lattice whose configurations are enumerated explicitly
 * when a sector basis is built (2^32 words).
 */
inline constexpr int MAX_ENUM_SITES = 32;

// ============================================================================
// Numerical Thresholds
// ============================================================================

/** Bloch sums with norm ≤ NORM_THRESH vanish in the sector and are pruned */
inline constexpr f64 NORM_THRESH = 1e-8;

/** Matrix element pruning: drop |M_ij| ≤ MAT_ELEMENT_THRESH */
inline constexpr f64 MAT_ELEMENT_THRESH = 1e-15;

/** Bond orientation angle of the triangular lattice: 2π/3 */
inline constexpr f64 BOND_ANGLE = 2.0 * std::numbers::pi / 3.0;

} // namespace trilat
