// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bloch.cpp
 * @brief Sector enumeration via orbit-minimum representatives.
 *
 * Each configuration is visited once. It starts a Bloch function iff no
 * translation maps it to a smaller word; the orbit is then walked row by
 * row (nx steps of T_x, then one T_y) accumulating the momentum phases.
 */

#include <trilat/basis/bloch.hpp>
#include <trilat/lattice/spin_config.hpp>
#include <trilat/utils/bit_utils.hpp>
#include <trilat/utils/constants.hpp>

#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

namespace trilat {

namespace {

void check_extents(int nx, int ny, const char* where) {
    if (nx < 1 || ny < 1) {
        throw std::invalid_argument(
            std::string(where) + ": lattice extents must be positive, got " +
            std::to_string(nx) + "x" + std::to_string(ny));
    }
}

constexpr int wrap_momentum(int k, int n) noexcept {
    const int r = k % n;
    return r < 0 ? r + n : r;
}

/**
 * Visit every n_sites-bit configuration (or every one with nup bits set)
 * in ascending order.
 */
template<class Fn>
void for_each_config(int n_sites, std::optional<int> nup, Fn&& fn) {
    if (n_sites < 1 || n_sites > MAX_ENUM_SITES) {
        throw std::invalid_argument(
            "for_each_config: " + std::to_string(n_sites) +
            " sites not in [1, " + std::to_string(MAX_ENUM_SITES) + "]");
    }

    const u64 overflow_bit = u64{1} << n_sites;

    if (!nup) {
        for (u64 dec = 0; dec < overflow_bit; ++dec) fn(dec);
        return;
    }

    const int k = *nup;
    if (k < 0 || k > n_sites) {
        throw std::invalid_argument(
            "for_each_config: nup=" + std::to_string(k) +
            " not in [0, " + std::to_string(n_sites) + "]");
    }
    if (k == 0) {
        fn(u64{0});
        return;
    }

    // Gosper's hack; terminates when the carry leaves the lattice width
    u64 x = make_mask<u64>(k);
    while (true) {
        fn(x);
        if ((x + isolate_lsb(x)) & overflow_bit) break;
        x = next_combination(x);
    }
}

/// True if no translation of dec is numerically smaller.
[[nodiscard]] bool is_orbit_minimum(u64 dec, int nx, int ny) noexcept {
    u64 row = dec;
    for (int n = 0; n < ny; ++n) {
        u64 cur = row;
        for (int m = 0; m < nx; ++m) {
            if (cur < dec) return false;
            cur = translate_x(cur, nx, ny);
        }
        row = translate_y(row, nx, ny);
    }
    return true;
}

[[nodiscard]] BlochFunc make_bloch(u64 lead, int nx, int ny, int kx, int ky) {
    BlochFunc bf;
    bf.lead = lead;

    const f64 qx = 2.0 * std::numbers::pi * kx / nx;
    const f64 qy = 2.0 * std::numbers::pi * ky / ny;

    u64 cur = lead;
    for (int n = 0; n < ny; ++n) {
        for (int m = 0; m < nx; ++m) {
            bf.decs[cur] += std::polar(1.0, qx * m + qy * n);
            cur = translate_x(cur, nx, ny);
        }
        cur = translate_y(cur, nx, ny);
    }

    f64 sq = 0.0;
    for (const auto& [dec, c] : bf.decs) sq += std::norm(c);
    bf.norm = std::sqrt(sq);
    return bf;
}

[[nodiscard]] std::vector<BlochFunc> build_momentum_states(
    int nx, int ny, int kx, int ky, std::optional<int> nup
) {
    std::vector<BlochFunc> states;
    for_each_config(nx * ny, nup, [&](u64 dec) {
        if (!is_orbit_minimum(dec, nx, ny)) return;
        BlochFunc bf = make_bloch(dec, nx, ny, kx, ky);
        if (bf.norm > NORM_THRESH) {
            states.push_back(std::move(bf));
        }
    });
    return states;
}

} // anonymous namespace

// ============================================================================
// Sector
// ============================================================================

Sector::Sector(int nx, int ny, int kx, int ky, std::optional<int> nup,
               std::vector<BlochFunc> states)
    : nx_(nx), ny_(ny), kx_(kx), ky_(ky), nup_(nup), states_(std::move(states)) {
    if (states_.size() > std::numeric_limits<u32>::max()) {
        throw std::length_error(
            "Sector: " + std::to_string(states_.size()) +
            " states exceed u32 index capacity");
    }

    size_t n_decs = 0;
    for (const auto& s : states_) n_decs += s.decs.size();

    dec_to_rep_.reserve(n_decs);
    lead_to_idx_.reserve(states_.size());
    idx_to_rep_.reserve(states_.size());

    for (size_t i = 0; i < states_.size(); ++i) {
        const BlochFunc* rep = &states_[i];
        idx_to_rep_.push_back(rep);
        lead_to_idx_.emplace(rep->lead, static_cast<u32>(i));
        for (const auto& [dec, c] : rep->decs) {
            dec_to_rep_.emplace(dec, rep);
        }
    }
}

Sector Sector::momentum(int nx, int ny, int kx, int ky) {
    check_extents(nx, ny, "Sector::momentum");
    kx = wrap_momentum(kx, nx);
    ky = wrap_momentum(ky, ny);
    return Sector(nx, ny, kx, ky, std::nullopt,
                  build_momentum_states(nx, ny, kx, ky, std::nullopt));
}

Sector Sector::momentum_nup(int nx, int ny, int kx, int ky, int nup) {
    check_extents(nx, ny, "Sector::momentum_nup");
    kx = wrap_momentum(kx, nx);
    ky = wrap_momentum(ky, ny);
    return Sector(nx, ny, kx, ky, nup,
                  build_momentum_states(nx, ny, kx, ky, nup));
}

Sector Sector::full_space(int nx, int ny, std::optional<int> nup) {
    check_extents(nx, ny, "Sector::full_space");

    std::vector<BlochFunc> states;
    for_each_config(nx * ny, nup, [&](u64 dec) {
        BlochFunc bf;
        bf.lead = dec;
        bf.decs.emplace(dec, cplx{1.0, 0.0});
        bf.norm = 1.0;
        states.push_back(std::move(bf));
    });
    return Sector(nx, ny, 0, 0, nup, std::move(states));
}

const BlochFunc& Sector::state(u32 idx) const {
    if (idx >= states_.size()) {
        throw std::out_of_range(
            "Sector::state: index " + std::to_string(idx) +
            " out of range [0, " + std::to_string(states_.size()) + ")");
    }
    return *idx_to_rep_[idx];
}

std::optional<u32> Sector::index_of(u64 lead) const {
    auto it = lead_to_idx_.find(lead);
    if (it == lead_to_idx_.end()) return std::nullopt;
    return it->second;
}

std::vector<u64> Sector::leads() const {
    std::vector<u64> out;
    out.reserve(states_.size());
    for (const auto& s : states_) out.push_back(s.lead);
    return out;
}

// ============================================================================
// Representative Lookup
// ============================================================================

std::optional<LeadingState> find_leading_state(u64 dec, const RepMap& dec_to_rep) {
    auto it = dec_to_rep.find(dec);
    if (it == dec_to_rep.end()) return std::nullopt;

    const BlochFunc* rep = it->second;
    const cplx c = rep->decs.at(dec);
    return LeadingState{rep, std::conj(c) / std::abs(c)};
}

std::vector<u64> enumerate_configs(int n_sites, std::optional<int> nup) {
    std::vector<u64> out;
    for_each_config(n_sites, nup, [&](u64 dec) { out.push_back(dec); });
    return out;
}

} // namespace trilat
