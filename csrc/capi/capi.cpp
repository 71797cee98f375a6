// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file capi.cpp
 * @brief C ABI entry points over the sector operator builders.
 *
 * Buffers cross the boundary as released std::unique_ptr<T[]> arrays and
 * come back through trilat_request_free(), which rebuilds and drops them.
 * Exceptions are converted to an empty matrix plus a thread-local message.
 */

#include "trilat_capi.h"

#include <trilat/basis/bloch.hpp>
#include <trilat/operator/build_op.hpp>

#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

using trilat::COOMatrix;
using trilat::Sector;

thread_local std::string g_last_error;
thread_local bool g_has_error = false;

static_assert(sizeof(TrilatComplex) == sizeof(trilat::cplx),
              "TrilatComplex must match std::complex<double>");

[[nodiscard]] TrilatCoordMatrix empty_matrix() noexcept {
    return TrilatCoordMatrix{{nullptr, 0}, {nullptr, 0}, {nullptr, 0}, 0, 0};
}

/// Hand the COO buffers over to the caller.
[[nodiscard]] TrilatCoordMatrix release_matrix(const COOMatrix& coo) {
    const size_t nnz = coo.nnz();

    auto data = std::make_unique<TrilatComplex[]>(nnz);
    auto col  = std::make_unique<uint32_t[]>(nnz);
    auto row  = std::make_unique<uint32_t[]>(nnz);

    for (size_t k = 0; k < nnz; ++k) {
        data[k] = TrilatComplex{coo.vals[k].real(), coo.vals[k].imag()};
    }
    if (nnz > 0) {
        std::memcpy(col.get(), coo.cols.data(), nnz * sizeof(uint32_t));
        std::memcpy(row.get(), coo.rows.data(), nnz * sizeof(uint32_t));
    }

    TrilatCoordMatrix out;
    out.data  = {data.release(), nnz};
    out.col   = {col.release(), nnz};
    out.row   = {row.release(), nnz};
    out.ncols = coo.n_cols;
    out.nrows = coo.n_rows;
    return out;
}

[[nodiscard]] Sector make_sector(int nx, int ny, int kx, int ky, std::optional<int> nup) {
    return nup ? Sector::momentum_nup(nx, ny, kx, ky, *nup)
               : Sector::momentum(nx, ny, kx, ky);
}

/**
 * Run a builder on the requested sector; never lets an exception escape.
 */
template<class Build>
TrilatCoordMatrix guarded(
    const char* name,
    int nx, int ny, int kx, int ky, std::optional<int> nup,
    Build&& build
) noexcept {
    try {
        const Sector sector = make_sector(nx, ny, kx, ky, nup);
        TrilatCoordMatrix out = release_matrix(build(sector));
        g_has_error = false;
        return out;
    } catch (const std::exception& e) {
        g_last_error = std::string(name) + ": " + e.what();
        g_has_error = true;
        return empty_matrix();
    }
}

} // anonymous namespace

extern "C" {

// ─── Momentum sector ──────────────────────────────────────────────────

TrilatCoordMatrix trilat_k_h_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_h_ss_z", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::h_ss_z(s, l); });
}

TrilatCoordMatrix trilat_k_h_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_h_ss_xy", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::h_ss_xy(s, l); });
}

TrilatCoordMatrix trilat_k_h_ss_ppmm(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_h_ss_ppmm", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::h_ss_ppmm(s, l); });
}

TrilatCoordMatrix trilat_k_h_ss_pmz(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_h_ss_pmz", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::h_ss_pmz(s, l); });
}

TrilatCoordMatrix trilat_k_h_ss_chi(int32_t nx, int32_t ny, int32_t kx, int32_t ky) {
    return guarded("trilat_k_h_ss_chi", nx, ny, kx, ky, std::nullopt,
                   [](const Sector& s) { return trilat::h_ss_chi(s); });
}

TrilatCoordMatrix trilat_k_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_ss_z", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::ss_z(s, l); });
}

TrilatCoordMatrix trilat_k_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l) {
    return guarded("trilat_k_ss_xy", nx, ny, kx, ky, std::nullopt,
                   [l](const Sector& s) { return trilat::ss_xy(s, l); });
}

// ─── Momentum + magnetization sector ──────────────────────────────────

TrilatCoordMatrix trilat_ks_h_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_h_ss_z", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::h_ss_z(s, l); });
}

TrilatCoordMatrix trilat_ks_h_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_h_ss_xy", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::h_ss_xy(s, l); });
}

TrilatCoordMatrix trilat_ks_h_ss_ppmm(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_h_ss_ppmm", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::h_ss_ppmm(s, l); });
}

TrilatCoordMatrix trilat_ks_h_ss_pmz(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_h_ss_pmz", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::h_ss_pmz(s, l); });
}

TrilatCoordMatrix trilat_ks_h_ss_chi(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup) {
    return guarded("trilat_ks_h_ss_chi", nx, ny, kx, ky, nup,
                   [](const Sector& s) { return trilat::h_ss_chi(s); });
}

TrilatCoordMatrix trilat_ks_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_ss_z", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::ss_z(s, l); });
}

TrilatCoordMatrix trilat_ks_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l) {
    return guarded("trilat_ks_ss_xy", nx, ny, kx, ky, nup,
                   [l](const Sector& s) { return trilat::ss_xy(s, l); });
}

// ─── Ownership and diagnostics ────────────────────────────────────────

void trilat_request_free(TrilatCoordMatrix matrix) {
    std::unique_ptr<TrilatComplex[]> data(matrix.data.ptr);
    std::unique_ptr<uint32_t[]> col(matrix.col.ptr);
    std::unique_ptr<uint32_t[]> row(matrix.row.ptr);
}

const char* trilat_last_error(void) {
    return g_has_error ? g_last_error.c_str() : nullptr;
}

} // extern "C"
