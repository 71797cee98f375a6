// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file site_vector.hpp
 * @brief Site coordinates on a periodic nx × ny triangular lattice.
 *
 * Lattice coordinates (x, y) refer to the primitive vectors
 *   a = (1, 0),  b = (1/2, √3/2)
 * so that site (x, y) sits at x·a + y·b. Index convention: x + nx·y.
 *
 * Neighbor shells (forward hops only, in lattice coordinates):
 *   nearest:  a1 = (1,0),  a2 = (-1,1), a3 = (0,-1)
 *   second:   b1 = (1,1),  b2 = (-2,1), b3 = (1,-2)
 *   third:    2·a1, 2·a2, 2·a3
 */

#pragma once

#include <trilat/utils/types.hpp>

#include <compare>
#include <utility>
#include <vector>

namespace trilat {

/**
 * Immutable site on the periodic triangular lattice.
 *
 * Ordering and equality follow the lattice index.
 */
class SiteVector {
public:
    /**
     * @param x, y  Coordinates (wrapped into [0, nx) × [0, ny))
     * @throws std::invalid_argument if nx < 1, ny < 1 or nx·ny > 64
     */
    SiteVector(int x, int y, int nx, int ny);

    /// Site with lattice index idx ∈ [0, nx·ny).
    [[nodiscard]] static SiteVector from_index(int idx, int nx, int ny);

    [[nodiscard]] int x() const noexcept { return x_; }
    [[nodiscard]] int y() const noexcept { return y_; }
    [[nodiscard]] int nx() const noexcept { return nx_; }
    [[nodiscard]] int ny() const noexcept { return ny_; }

    [[nodiscard]] int lattice_index() const noexcept { return x_ + nx_ * y_; }

    /// One-bit configuration mask of this site.
    [[nodiscard]] u64 mask() const noexcept;

    /// Next site in row-major order (wraps to the origin after the last).
    [[nodiscard]] SiteVector next_site() const noexcept;

    [[nodiscard]] SiteVector xhop(int stride) const noexcept;
    [[nodiscard]] SiteVector yhop(int stride) const noexcept;

    // ─── Neighbor shells ──────────────────────────────────────────────

    [[nodiscard]] std::vector<SiteVector> nearest_neighboring_sites() const;
    [[nodiscard]] std::vector<SiteVector> second_neighboring_sites() const;
    [[nodiscard]] std::vector<SiteVector> third_neighboring_sites() const;

    /// Shell by range l ∈ {1, 2, 3}; throws std::invalid_argument otherwise.
    [[nodiscard]] std::vector<SiteVector> neighboring_sites(int range) const;

    // ─── Geometry ─────────────────────────────────────────────────────

    /**
     * Minimal-image displacement other − this.
     * Each component lies in (−n/2, n/2].
     */
    [[nodiscard]] std::pair<int, int> displacement(const SiteVector& other) const noexcept;

    /**
     * Oriented bond angle toward other.
     *
     * 0 for dy = 0, otherwise sgn(dy)·2π/3 on the minimal image; when dy and
     * −dy coincide (2|dy| = ny) the lower lattice index takes the + sign.
     * Antisymmetric: a.angle_with(b) = −b.angle_with(a).
     */
    [[nodiscard]] f64 angle_with(const SiteVector& other) const noexcept;

    [[nodiscard]] bool operator==(const SiteVector& o) const noexcept {
        return lattice_index() == o.lattice_index();
    }
    [[nodiscard]] std::strong_ordering operator<=>(const SiteVector& o) const noexcept {
        return lattice_index() <=> o.lattice_index();
    }

private:
    [[nodiscard]] SiteVector hop(int dx, int dy) const noexcept;

    /// Collect hops (dx, dy) that do not land back on this site.
    [[nodiscard]] std::vector<SiteVector> shell(
        const std::pair<int, int> (&hops)[3]
    ) const;

    int x_;
    int y_;
    int nx_;
    int ny_;
};

} // namespace trilat
