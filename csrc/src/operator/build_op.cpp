// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file build_op.cpp
 * @brief Parallel streaming assembly of sector operator matrices.
 *
 * Core algorithm: For each representative |i⟩ of the sector, evaluate the
 * row kernel on its lead, route surviving elements to the thread-local
 * COO sink, then merge and canonicalize all sinks.
 */

#include <trilat/operator/build_op.hpp>
#include <trilat/lattice/bonds.hpp>
#include <trilat/operator/elements.hpp>
#include <trilat/utils/constants.hpp>

#include <cstddef>
#include <stdexcept>
#include <string>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace trilat {

namespace {

// ============================================================================
// Parallel streaming kernels
// ============================================================================

/**
 * Core assembly loop over origin rows.
 *
 * Emit(row, bra, sink) pushes the row's elements into sink; entries that
 * cancel or fall below MAT_ELEMENT_THRESH are dropped at the merge.
 */
template<class Emit>
COOMatrix stream_build(const Sector& sector, Emit&& emit) {
    const size_t n = sector.size();

    int n_threads = 1;
#ifdef _OPENMP
    n_threads = omp_get_max_threads();
#endif

    std::vector<COOMatrix> tl(static_cast<size_t>(n_threads));

#pragma omp parallel for schedule(dynamic)
    for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(n); ++i) {
        int tid = 0;
#ifdef _OPENMP
        tid = omp_get_thread_num();
#endif
        const u32 row = static_cast<u32>(i);
        emit(row, *sector.idx_to_rep()[row], tl[static_cast<size_t>(tid)]);
    }

    COOMatrix out;
    out.n_rows = sector.size();
    out.n_cols = sector.size();
    merge_thread_local(tl, out);
    return out;
}

/**
 * Diagonal operator: kernel(lead) → f64.
 */
template<class Kernel>
COOMatrix build_diag_op(const Sector& sector, Kernel&& kernel) {
    return stream_build(sector, [&](u32 row, const BlochFunc& bra, COOMatrix& sink) {
        sink.push_back(row, row, kernel(bra.lead));
    });
}

/**
 * Off-diagonal operator: kernel(bra) → RowElements.
 */
template<class Kernel>
COOMatrix build_offdiag_op(const Sector& sector, Kernel&& kernel) {
    return stream_build(sector, [&](u32 row, const BlochFunc& bra, COOMatrix& sink) {
        for (const auto& [col, h] : kernel(bra)) {
            sink.push_back(row, col, h);
        }
    });
}

} // anonymous namespace

// ============================================================================
// Bond Operators
// ============================================================================

COOMatrix h_ss_z(const Sector& sector, int l) {
    const SitePairs sites = interacting_sites(sector.nx(), sector.ny(), l);
    return build_diag_op(sector, [&](u64 dec) {
        return ss_z_elements(dec, sites);
    });
}

COOMatrix h_ss_xy(const Sector& sector, int l) {
    const SitePairs sites = interacting_sites(sector.nx(), sector.ny(), l);
    return build_offdiag_op(sector, [&](const BlochFunc& bra) {
        return ss_xy_elements(bra, sites, sector);
    });
}

COOMatrix h_ss_ppmm(const Sector& sector, int l) {
    const SitePairs sites = interacting_sites(sector.nx(), sector.ny(), l);
    return build_offdiag_op(sector, [&](const BlochFunc& bra) {
        return ss_ppmm_elements(bra, sites, sector);
    });
}

COOMatrix h_ss_pmz(const Sector& sector, int l) {
    const SitePairs sites = interacting_sites(sector.nx(), sector.ny(), l);
    return build_offdiag_op(sector, [&](const BlochFunc& bra) {
        return ss_pmz_elements(bra, sites, sector);
    });
}

COOMatrix h_ss_chi(const Sector& sector) {
    const TriangleSites triangles = triangular_vert_sites(sector.nx(), sector.ny());
    return build_offdiag_op(sector, [&](const BlochFunc& bra) {
        return ss_chi_elements(bra, triangles, sector);
    });
}

// ============================================================================
// Correlators
// ============================================================================

COOMatrix ss_z(const Sector& sector, int l) {
    const SitePairs sites = all_sites(sector.nx(), sector.ny(), l);
    return build_diag_op(sector, [&](u64 dec) {
        return ss_z_elements(dec, sites);
    });
}

COOMatrix ss_xy(const Sector& sector, int l) {
    const SitePairs sites = all_sites(sector.nx(), sector.ny(), l);
    // S^xS^x + S^yS^y = (S^+S^- + S^-S^+)/2
    return build_offdiag_op(sector, [&](const BlochFunc& bra) {
        return ss_xy_elements(bra, sites, sector, 0.5);
    });
}

// ============================================================================
// Hamiltonian Assembly
// ============================================================================

COOMatrix build_hamiltonian(const Sector& sector, const Couplings& c) {
    if ((c.J2 != 0.0 || c.J3 != 0.0) && c.J_pm == 0.0) {
        throw std::invalid_argument(
            "build_hamiltonian: J2=" + std::to_string(c.J2) +
            ", J3=" + std::to_string(c.J3) +
            " require nonzero J_pm for the J_z/J_pm anisotropy");
    }

    COOMatrix H;
    H.n_rows = sector.size();
    H.n_cols = sector.size();

    // Terms with zero coupling are never built
    auto add = [&](f64 coupling, auto&& build) {
        if (coupling == 0.0) return;
        COOMatrix term = build();
        coo_scale(term, coupling);
        H = coo_add(H, term, MAT_ELEMENT_THRESH);
    };

    add(c.J_pm,   [&] { return h_ss_xy(sector, 1); });
    add(c.J_z,    [&] { return h_ss_z(sector, 1); });
    add(c.J_ppmm, [&] { return h_ss_ppmm(sector, 1); });
    add(c.J_pmz,  [&] { return h_ss_pmz(sector, 1); });

    const f64 aniso = (c.J_pm != 0.0) ? c.J_z / c.J_pm : 0.0;
    add(c.J2,         [&] { return h_ss_xy(sector, 2); });
    add(c.J2 * aniso, [&] { return h_ss_z(sector, 2); });
    add(c.J3,         [&] { return h_ss_xy(sector, 3); });
    add(c.J3 * aniso, [&] { return h_ss_z(sector, 3); });

    return H;
}

} // namespace trilat
