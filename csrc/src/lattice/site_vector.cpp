// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file site_vector.cpp
 * @brief Periodic triangular-lattice coordinates and neighbor shells.
 */

#include <trilat/lattice/site_vector.hpp>
#include <trilat/utils/bit_utils.hpp>
#include <trilat/utils/constants.hpp>

#include <stdexcept>
#include <string>

namespace trilat {

namespace {

constexpr std::pair<int, int> NEAREST_HOPS[3] = {{1, 0}, {-1, 1}, {0, -1}};
constexpr std::pair<int, int> SECOND_HOPS[3]  = {{1, 1}, {-2, 1}, {1, -2}};
constexpr std::pair<int, int> THIRD_HOPS[3]   = {{2, 0}, {-2, 2}, {0, -2}};

/// Wrap v into [0, n).
constexpr int wrap(int v, int n) noexcept {
    const int r = v % n;
    return r < 0 ? r + n : r;
}

/// Wrap v into (−n/2, n/2].
constexpr int min_image(int v, int n) noexcept {
    const int r = wrap(v, n);
    return (2 * r > n) ? r - n : r;
}

} // anonymous namespace

SiteVector::SiteVector(int x, int y, int nx, int ny)
    : nx_(nx), ny_(ny) {
    if (nx < 1 || ny < 1) {
        throw std::invalid_argument(
            "SiteVector: lattice extents must be positive, got " +
            std::to_string(nx) + "x" + std::to_string(ny));
    }
    if (nx * ny > MAX_SITES_U64) {
        throw std::invalid_argument(
            "SiteVector: " + std::to_string(nx) + "x" + std::to_string(ny) +
            " lattice exceeds " + std::to_string(MAX_SITES_U64) + " sites");
    }
    x_ = wrap(x, nx);
    y_ = wrap(y, ny);
}

SiteVector SiteVector::from_index(int idx, int nx, int ny) {
    if (nx < 1 || ny < 1 || idx < 0 || idx >= nx * ny) {
        throw std::out_of_range(
            "SiteVector::from_index: index " + std::to_string(idx) +
            " out of range for " + std::to_string(nx) + "x" +
            std::to_string(ny) + " lattice");
    }
    return SiteVector(idx % nx, idx / nx, nx, ny);
}

u64 SiteVector::mask() const noexcept {
    return site_mask<u64>(lattice_index());
}

SiteVector SiteVector::next_site() const noexcept {
    return from_index((lattice_index() + 1) % (nx_ * ny_), nx_, ny_);
}

SiteVector SiteVector::hop(int dx, int dy) const noexcept {
    SiteVector out = *this;
    out.x_ = wrap(x_ + dx, nx_);
    out.y_ = wrap(y_ + dy, ny_);
    return out;
}

SiteVector SiteVector::xhop(int stride) const noexcept { return hop(stride, 0); }
SiteVector SiteVector::yhop(int stride) const noexcept { return hop(0, stride); }

std::vector<SiteVector> SiteVector::shell(
    const std::pair<int, int> (&hops)[3]
) const {
    std::vector<SiteVector> out;
    out.reserve(3);
    for (const auto& [dx, dy] : hops) {
        const SiteVector n = hop(dx, dy);
        if (n != *this) {
            out.push_back(n);
        }
    }
    return out;
}

std::vector<SiteVector> SiteVector::nearest_neighboring_sites() const {
    return shell(NEAREST_HOPS);
}

std::vector<SiteVector> SiteVector::second_neighboring_sites() const {
    return shell(SECOND_HOPS);
}

std::vector<SiteVector> SiteVector::third_neighboring_sites() const {
    return shell(THIRD_HOPS);
}

std::vector<SiteVector> SiteVector::neighboring_sites(int range) const {
    switch (range) {
        case 1: return nearest_neighboring_sites();
        case 2: return second_neighboring_sites();
        case 3: return third_neighboring_sites();
        default:
            throw std::invalid_argument(
                "SiteVector::neighboring_sites: range " +
                std::to_string(range) + " not in {1, 2, 3}");
    }
}

std::pair<int, int> SiteVector::displacement(const SiteVector& other) const noexcept {
    return {min_image(other.x_ - x_, nx_), min_image(other.y_ - y_, ny_)};
}

f64 SiteVector::angle_with(const SiteVector& other) const noexcept {
    const int dy = displacement(other).second;
    if (dy == 0) return 0.0;

    int sign = (dy > 0) ? 1 : -1;
    // dy ≡ −dy (mod ny): orientation is fixed by index order instead
    if (2 * dy == ny_) {
        sign = (lattice_index() < other.lattice_index()) ? 1 : -1;
    }
    return sign * BOND_ANGLE;
}

} // namespace trilat
