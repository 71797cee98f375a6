// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file elements.hpp
 * @brief Per-row matrix elements of two- and three-site spin operators.
 *
 * Each accumulator acts on the lead of an origin Bloch function and maps
 * every resulting configuration onto its representative:
 *   M[orig][dest] += amplitude · phase · dest.norm / orig.norm
 * Destinations without a state in the sector contribute nothing.
 *
 * Operators (S^± = S^x ± iS^y, γ = bond phase):
 *   zz:    S^z_1 S^z_2
 *   xy:    S^+_1 S^-_2 + S^-_1 S^+_2
 *   ppmm:  γ S^+_1 S^+_2 + γ* S^-_1 S^-_2
 *   pmz:   i Σ_{(a,b)} S^z_a (γ_ab* S^-_b − γ_ab S^+_b),  (a,b) ∈ {(1,2), (2,1)}
 *   chi:   σ (i/2) Σ_cyc S^z_i (S^+_j S^-_k − S^-_j S^+_k)
 */

#pragma once

#include <trilat/basis/bloch.hpp>
#include <trilat/lattice/bonds.hpp>
#include <trilat/utils/types.hpp>

#include <unordered_map>

namespace trilat {

/// Destination column → accumulated coefficient.
using RowElements = std::unordered_map<u32, cplx>;

/**
 * Diagonal S^z S^z sum: 0.25·(#aligned − #anti-aligned) over pairs.
 */
[[nodiscard]] f64 ss_z_elements(u64 dec, const SitePairs& sites) noexcept;

[[nodiscard]] RowElements ss_xy_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J = 1.0
);

[[nodiscard]] RowElements ss_ppmm_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J = 1.0
);

[[nodiscard]] RowElements ss_pmz_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J = 1.0
);

/**
 * Scalar chirality S_i · (S_j × S_k) over elementary triangles,
 * weighted by triangle orientation (+1 up, −1 down).
 */
[[nodiscard]] RowElements ss_chi_elements(
    const BlochFunc& orig,
    const TriangleSites& triangles,
    const Sector& sector,
    f64 J = 1.0
);

} // namespace trilat
