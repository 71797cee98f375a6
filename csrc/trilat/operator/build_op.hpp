// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file build_op.hpp
 * @brief Sector matrices of spin operators and model Hamiltonians.
 *
 * Bond operators (h_*) sum over the bonds of one neighbor range with
 * unit coupling. Correlators (ss_*) sum over every site paired with its
 * partner at separation l, see all_sites().
 *
 * Output: Deterministic sorted COO with merged duplicates,
 *         n_rows = n_cols = sector.size().
 * Threading: OpenMP parallelism over rows with thread-local sinks.
 */

#pragma once

#include <trilat/basis/bloch.hpp>
#include <trilat/operator/sparse_utils.hpp>
#include <trilat/utils/types.hpp>

namespace trilat {

// ============================================================================
// Bond Operators
// ============================================================================

/// Σ_bonds S^z S^z over range-l bonds (diagonal).
[[nodiscard]] COOMatrix h_ss_z(const Sector& sector, int l = 1);

/// Σ_bonds (S^+S^- + S^-S^+) over range-l bonds.
[[nodiscard]] COOMatrix h_ss_xy(const Sector& sector, int l = 1);

/// Σ_bonds (γ S^+S^+ + γ* S^-S^-); empty in fixed-nup sectors.
[[nodiscard]] COOMatrix h_ss_ppmm(const Sector& sector, int l = 1);

/// Σ_bonds i S^z (γ* S^- − γ S^+), both site orders; empty in fixed-nup sectors.
[[nodiscard]] COOMatrix h_ss_pmz(const Sector& sector, int l = 1);

/// Orientation-weighted scalar chirality over all elementary triangles.
[[nodiscard]] COOMatrix h_ss_chi(const Sector& sector);

// ============================================================================
// Correlators
// ============================================================================

/// Σ_r S^z_r S^z_{r+d(l)} (diagonal).
[[nodiscard]] COOMatrix ss_z(const Sector& sector, int l);

/// Σ_r (S^x_r S^x_{r+d(l)} + S^y_r S^y_{r+d(l)}).
[[nodiscard]] COOMatrix ss_xy(const Sector& sector, int l);

// ============================================================================
// Hamiltonian Assembly
// ============================================================================

/**
 * Couplings of the anisotropic triangular-lattice model.
 *
 * H = J_pm·H_pm(1) + J_z·H_z(1) + J_ppmm·H_ppmm + J_pmz·H_pmz
 *   + J2·(H_pm(2) + (J_z/J_pm)·H_z(2))
 *   + J3·(H_pm(3) + (J_z/J_pm)·H_z(3))
 *
 * Further-neighbor terms inherit the nearest-neighbor anisotropy J_z/J_pm.
 */
struct Couplings {
    f64 J_pm   = 0.0;
    f64 J_z    = 0.0;
    f64 J_ppmm = 0.0;
    f64 J_pmz  = 0.0;
    f64 J2     = 0.0;
    f64 J3     = 0.0;
};

/**
 * Assemble the model Hamiltonian on a sector. Zero couplings skip their term.
 *
 * @throws std::invalid_argument if J2 or J3 is nonzero while J_pm == 0
 */
[[nodiscard]] COOMatrix build_hamiltonian(const Sector& sector, const Couplings& c);

} // namespace trilat
