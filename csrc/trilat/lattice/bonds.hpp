// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bonds.hpp
 * @brief Bond tables, site-pair masks and elementary triangles.
 *
 * Bonds are emitted site by site in row-major order, each in hop
 * orientation (second = first + hop). With unique = true a bond whose
 * unordered site pair was already emitted in the same range is dropped,
 * so small lattices where forward and backward hops coincide count each
 * pair once (4x1 chain: 4 nearest-neighbor bonds).
 */

#pragma once

#include <trilat/lattice/site_vector.hpp>
#include <trilat/utils/types.hpp>

#include <array>
#include <vector>

namespace trilat {

/**
 * Oriented bond; equality ignores orientation.
 */
struct Bond {
    SiteVector first;
    SiteVector second;

    [[nodiscard]] bool operator==(const Bond& o) const noexcept {
        return (first == o.first && second == o.second) ||
               (first == o.second && second == o.first);
    }
};

/**
 * Bond lists for ranges 1, 2, 3 (nearest, second, third neighbor).
 */
struct BondTable {
    std::array<std::vector<Bond>, 3> ranges;

    /** Bonds of range l ∈ {1, 2, 3}; throws std::invalid_argument otherwise */
    [[nodiscard]] const std::vector<Bond>& by_range(int l) const;
};

/**
 * Parallel single-bit masks (site1[k], site2[k]).
 */
struct SitePairs {
    std::vector<u64> site1;
    std::vector<u64> site2;

    [[nodiscard]] size_t size() const noexcept { return site1.size(); }
    [[nodiscard]] bool empty() const noexcept { return site1.empty(); }

    void push_back(u64 s1, u64 s2) {
        site1.push_back(s1);
        site2.push_back(s2);
    }
};

/**
 * Elementary triangles in clockwise vertex order.
 * orientation[k] = +1 for upward, −1 for downward triangles.
 */
struct TriangleSites {
    std::vector<u64> site1;
    std::vector<u64> site2;
    std::vector<u64> site3;
    std::vector<int> orientation;

    [[nodiscard]] size_t size() const noexcept { return site1.size(); }
};

// ============================================================================
// Generators
// ============================================================================

[[nodiscard]] BondTable generate_bonds(int nx, int ny, bool unique = true);

/**
 * Bonds of range l projected to site masks, in bond order.
 *
 * @throws std::invalid_argument if l ∉ {1, 2, 3}
 */
[[nodiscard]] SitePairs interacting_sites(int nx, int ny, int l, bool unique = true);

/**
 * Every site paired with the site displaced by (l % nx, l / nx).
 *
 * One pair per site in row-major order, without deduplication, so sums
 * over the result are translation averages times N.
 *
 * @throws std::invalid_argument if l ∉ [0, nx·ny)
 */
[[nodiscard]] SitePairs all_sites(int nx, int ny, int l);

/**
 * Upward [r, r+(0,1), r+(1,0)] and downward [r+(0,1), r+(1,1), r+(1,0)]
 * triangle of every cell r, row-major.
 */
[[nodiscard]] TriangleSites triangular_vert_sites(int nx, int ny);

/**
 * Bond phase exp(i·θ(s1 → s2)) for single-bit site masks.
 *
 * |gamma| = 1 and gamma(s1, s2) = conj(gamma(s2, s1)).
 */
[[nodiscard]] cplx gamma(int nx, int ny, u64 s1, u64 s2);

} // namespace trilat
