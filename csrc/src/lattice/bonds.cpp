// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bonds.cpp
 * @brief Bond enumeration, site-pair projection and triangle tables.
 */

#include <trilat/lattice/bonds.hpp>
#include <trilat/utils/bit_utils.hpp>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>

namespace trilat {

namespace {

void check_range(int l, const char* where) {
    if (l < 1 || l > 3) {
        throw std::invalid_argument(
            std::string(where) + ": range " + std::to_string(l) +
            " not in {1, 2, 3}");
    }
}

/// Orientation-free key of a site pair.
[[nodiscard]] u64 pair_key(const SiteVector& a, const SiteVector& b) noexcept {
    const int i = a.lattice_index();
    const int j = b.lattice_index();
    const u64 lo = static_cast<u64>(std::min(i, j));
    const u64 hi = static_cast<u64>(std::max(i, j));
    return (lo << 32) | hi;
}

} // anonymous namespace

const std::vector<Bond>& BondTable::by_range(int l) const {
    check_range(l, "BondTable::by_range");
    return ranges[static_cast<size_t>(l - 1)];
}

BondTable generate_bonds(int nx, int ny, bool unique) {
    BondTable table;

    const SiteVector origin(0, 0, nx, ny);
    const int n_sites = nx * ny;

    for (int l = 1; l <= 3; ++l) {
        auto& bonds = table.ranges[static_cast<size_t>(l - 1)];
        bonds.reserve(3 * static_cast<size_t>(n_sites));
        std::unordered_set<u64> seen;

        SiteVector site = origin;
        for (int i = 0; i < n_sites; ++i, site = site.next_site()) {
            for (const auto& nb : site.neighboring_sites(l)) {
                if (unique && !seen.insert(pair_key(site, nb)).second) {
                    continue;
                }
                bonds.push_back({site, nb});
            }
        }
    }

    return table;
}

SitePairs interacting_sites(int nx, int ny, int l, bool unique) {
    check_range(l, "interacting_sites");

    const BondTable table = generate_bonds(nx, ny, unique);
    const auto& bonds = table.by_range(l);

    SitePairs out;
    out.site1.reserve(bonds.size());
    out.site2.reserve(bonds.size());
    for (const auto& b : bonds) {
        out.push_back(b.first.mask(), b.second.mask());
    }
    return out;
}

SitePairs all_sites(int nx, int ny, int l) {
    const SiteVector origin(0, 0, nx, ny);
    const int n_sites = nx * ny;
    if (l < 0 || l >= n_sites) {
        throw std::invalid_argument(
            "all_sites: separation " + std::to_string(l) +
            " not in [0, " + std::to_string(n_sites) + ")");
    }

    const int xstride = l % nx;
    const int ystride = l / nx;

    SitePairs out;
    out.site1.reserve(static_cast<size_t>(n_sites));
    out.site2.reserve(static_cast<size_t>(n_sites));

    SiteVector site = origin;
    for (int i = 0; i < n_sites; ++i, site = site.next_site()) {
        out.push_back(site.mask(), site.xhop(xstride).yhop(ystride).mask());
    }
    return out;
}

TriangleSites triangular_vert_sites(int nx, int ny) {
    const SiteVector origin(0, 0, nx, ny);
    const int n_sites = nx * ny;

    TriangleSites out;
    const size_t cap = 2 * static_cast<size_t>(n_sites);
    out.site1.reserve(cap);
    out.site2.reserve(cap);
    out.site3.reserve(cap);
    out.orientation.reserve(cap);

    SiteVector r = origin;
    for (int i = 0; i < n_sites; ++i, r = r.next_site()) {
        const SiteVector up = r.yhop(1);

        // Upward: r, r+(0,1), r+(1,0)
        out.site1.push_back(r.mask());
        out.site2.push_back(up.mask());
        out.site3.push_back(r.xhop(1).mask());
        out.orientation.push_back(+1);

        // Downward: r+(0,1), r+(1,1), r+(1,0)
        out.site1.push_back(up.mask());
        out.site2.push_back(up.xhop(1).mask());
        out.site3.push_back(r.xhop(1).mask());
        out.orientation.push_back(-1);
    }
    return out;
}

cplx gamma(int nx, int ny, u64 s1, u64 s2) {
    const auto a = SiteVector::from_index(ctz(s1), nx, ny);
    const auto b = SiteVector::from_index(ctz(s2), nx, ny);
    return std::polar(1.0, a.angle_with(b));
}

} // namespace trilat
