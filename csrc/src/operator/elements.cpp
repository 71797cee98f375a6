// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file elements.cpp
 * @brief Matrix-element accumulators on Bloch representatives.
 */

#include <trilat/operator/elements.hpp>
#include <trilat/lattice/spin_config.hpp>
#include <trilat/utils/bit_utils.hpp>

namespace trilat {

namespace {

constexpr cplx I{0.0, 1.0};

/**
 * Project configuration dest onto its representative and accumulate
 * amp · phase · norm ratio into its column.
 */
void accumulate(
    RowElements& out,
    const BlochFunc& orig,
    u64 dest,
    cplx amp,
    const Sector& sector
) {
    const auto ls = find_leading_state(dest, sector.dec_to_rep());
    if (!ls) return;

    const u32 col = sector.lead_to_idx().at(ls->state->lead);
    out[col] += amp * ls->phase * coeff(orig, *ls->state);
}

/// S^z eigenvalue of a site: +1/2 up, −1/2 down.
constexpr f64 spin_z(u64 dec, u64 site) noexcept {
    return has_bits(dec, site) ? 0.5 : -0.5;
}

} // anonymous namespace

f64 ss_z_elements(u64 dec, const SitePairs& sites) noexcept {
    int balance = 0;
    for (size_t k = 0; k < sites.size(); ++k) {
        const auto [upup, downdown] = repeated_spins(dec, sites.site1[k], sites.site2[k]);
        balance += (upup || downdown) ? 1 : -1;
    }
    return 0.25 * balance;
}

RowElements ss_xy_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J
) {
    RowElements out;
    const u64 dec = orig.lead;

    for (size_t k = 0; k < sites.size(); ++k) {
        const u64 s1 = sites.site1[k];
        const u64 s2 = sites.site2[k];

        const auto [updown, downup] = exchange_spin_flips(dec, s1, s2);
        if (!updown && !downup) continue;

        accumulate(out, orig, dec ^ s1 ^ s2, J, sector);
    }
    return out;
}

RowElements ss_ppmm_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J
) {
    RowElements out;
    const u64 dec = orig.lead;
    const int nx = sector.nx();
    const int ny = sector.ny();

    for (size_t k = 0; k < sites.size(); ++k) {
        const u64 s1 = sites.site1[k];
        const u64 s2 = sites.site2[k];
        if (s1 == s2) continue;

        const auto [upup, downdown] = repeated_spins(dec, s1, s2);
        if (upup) {
            // S^-_1 S^-_2
            accumulate(out, orig, dec & ~(s1 | s2),
                       J * std::conj(gamma(nx, ny, s1, s2)), sector);
        } else if (downdown) {
            // S^+_1 S^+_2
            accumulate(out, orig, dec | s1 | s2,
                       J * gamma(nx, ny, s1, s2), sector);
        }
    }
    return out;
}

RowElements ss_pmz_elements(
    const BlochFunc& orig,
    const SitePairs& sites,
    const Sector& sector,
    f64 J
) {
    RowElements out;
    const u64 dec = orig.lead;
    const int nx = sector.nx();
    const int ny = sector.ny();
    const cplx iJ = I * J;

    for (size_t k = 0; k < sites.size(); ++k) {
        const u64 s1 = sites.site1[k];
        const u64 s2 = sites.site2[k];
        if (s1 == s2) continue;

        const u64 order[2][2] = {{s1, s2}, {s2, s1}};

        for (const auto& [a, b] : order) {
            // Phase follows the ordered pair: gamma(b, a) = conj(gamma(a, b))
            const cplx g = gamma(nx, ny, a, b);
            const f64 z = spin_z(dec, a);
            if (has_bits(dec, b)) {
                accumulate(out, orig, dec & ~b, iJ * z * std::conj(g), sector);
            } else {
                accumulate(out, orig, dec | b, -iJ * z * g, sector);
            }
        }
    }
    return out;
}

RowElements ss_chi_elements(
    const BlochFunc& orig,
    const TriangleSites& triangles,
    const Sector& sector,
    f64 J
) {
    RowElements out;
    const u64 dec = orig.lead;

    for (size_t t = 0; t < triangles.size(); ++t) {
        const u64 v[3] = {triangles.site1[t], triangles.site2[t], triangles.site3[t]};
        const cplx pref = J * triangles.orientation[t] * 0.5 * I;

        for (int c = 0; c < 3; ++c) {
            const u64 si = v[c];
            const u64 sj = v[(c + 1) % 3];
            const u64 sk = v[(c + 2) % 3];

            const auto [updown, downup] = exchange_spin_flips(dec, sj, sk);
            if (!updown && !downup) continue;

            // S^+_j S^-_k acts on down-up, S^-_j S^+_k on up-down
            const f64 amp = downup ? 1.0 : -1.0;
            accumulate(out, orig, dec ^ sj ^ sk,
                       pref * spin_z(dec, si) * amp, sector);
        }
    }
    return out;
}

} // namespace trilat
