// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file types.hpp
 * @brief Platform-independent type aliases and compatibility checks.
 *
 * Fixed-width integer/float types for deterministic bit arithmetic on
 * spin configurations, plus the complex scalar used for every matrix
 * element. Enforces the memory layout the C ABI relies on.
 */

#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>

namespace trilat {

// Unsigned integers - Configuration words and matrix indices
using u8  = std::uint8_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

// Floating-point - Numerical computations
using f64  = double;
using cplx = std::complex<f64>;

// Platform compatibility checks
static_assert(sizeof(f64) == 8, "64-bit double required");
static_assert(sizeof(cplx) == 2 * sizeof(f64),
              "std::complex<double> must be layout-compatible with {re, im}");

} // namespace trilat
