// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bloch.hpp
 * @brief Translation-symmetric Bloch basis of a momentum sector.
 *
 * A Bloch function with momentum (kx, ky) is the orbit sum
 *   |ψ⟩ = (1/norm) Σ_{m,n} e^{2πi(kx·m/nx + ky·n/ny)} T_y^n T_x^m |lead⟩
 * collected per orbit member in `decs`. `lead` is the numerically smallest
 * member of the orbit. Orbits whose phases cancel (norm ≤ NORM_THRESH)
 * carry no state in the sector and are pruned.
 */

#pragma once

#include <trilat/utils/types.hpp>

#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace trilat {

struct BlochFunc {
    u64 lead = 0;
    std::unordered_map<u64, cplx> decs;
    f64 norm = 0.0;
};

/**
 * Representative of a configuration and the phase that maps the
 * configuration's orbit amplitude onto it: conj(c)/|c|.
 */
struct LeadingState {
    const BlochFunc* state;
    cplx phase;
};

using RepMap = std::unordered_map<u64, const BlochFunc*>;

/**
 * Immutable basis of one symmetry sector with its lookup tables.
 *
 * Maps hold pointers into the owned state vector, so the sector is
 * movable but not copyable.
 */
class Sector {
public:
    /**
     * Momentum sector over all 2^N configurations.
     *
     * @throws std::invalid_argument if nx·ny > MAX_ENUM_SITES
     */
    [[nodiscard]] static Sector momentum(int nx, int ny, int kx, int ky);

    /// Momentum sector restricted to popcount(dec) == nup.
    [[nodiscard]] static Sector momentum_nup(int nx, int ny, int kx, int ky, int nup);

    /**
     * Unreduced basis: every configuration is its own representative
     * with unit amplitude.
     */
    [[nodiscard]] static Sector full_space(
        int nx, int ny, std::optional<int> nup = std::nullopt
    );

    Sector(const Sector&) = delete;
    Sector& operator=(const Sector&) = delete;
    Sector(Sector&&) = default;
    Sector& operator=(Sector&&) = default;
    ~Sector() = default;

    [[nodiscard]] int nx() const noexcept { return nx_; }
    [[nodiscard]] int ny() const noexcept { return ny_; }
    [[nodiscard]] int kx() const noexcept { return kx_; }
    [[nodiscard]] int ky() const noexcept { return ky_; }
    [[nodiscard]] std::optional<int> nup() const noexcept { return nup_; }

    [[nodiscard]] u32 size() const noexcept { return static_cast<u32>(states_.size()); }
    [[nodiscard]] bool empty() const noexcept { return states_.empty(); }

    [[nodiscard]] std::span<const BlochFunc> states() const noexcept { return states_; }

    /// Index → representative (bounds-checked).
    [[nodiscard]] const BlochFunc& state(u32 idx) const;

    /// Representative configuration → index.
    [[nodiscard]] std::optional<u32> index_of(u64 lead) const;

    /// Lead configurations in index order.
    [[nodiscard]] std::vector<u64> leads() const;

    [[nodiscard]] const RepMap& dec_to_rep() const noexcept { return dec_to_rep_; }
    [[nodiscard]] const std::unordered_map<u64, u32>& lead_to_idx() const noexcept {
        return lead_to_idx_;
    }
    [[nodiscard]] std::span<const BlochFunc* const> idx_to_rep() const noexcept {
        return idx_to_rep_;
    }

private:
    Sector(int nx, int ny, int kx, int ky, std::optional<int> nup,
           std::vector<BlochFunc> states);

    int nx_;
    int ny_;
    int kx_;
    int ky_;
    std::optional<int> nup_;

    std::vector<BlochFunc> states_;
    RepMap dec_to_rep_;
    std::unordered_map<u64, u32> lead_to_idx_;
    std::vector<const BlochFunc*> idx_to_rep_;
};

// ============================================================================
// Representative Lookup
// ============================================================================

/**
 * Locate the representative of dec.
 *
 * @return nullopt if dec has no state in the sector
 */
[[nodiscard]] std::optional<LeadingState> find_leading_state(
    u64 dec, const RepMap& dec_to_rep
);

/**
 * Normalization ratio dest.norm / orig.norm of a transition.
 */
[[nodiscard]] inline f64 coeff(const BlochFunc& orig, const BlochFunc& dest) noexcept {
    return dest.norm / orig.norm;
}

/**
 * Configurations of an N-site lattice, optionally with fixed popcount,
 * in ascending order.
 *
 * @throws std::invalid_argument if n_sites > MAX_ENUM_SITES or nup ∉ [0, N]
 */
[[nodiscard]] std::vector<u64> enumerate_configs(
    int n_sites, std::optional<int> nup = std::nullopt
);

} // namespace trilat
