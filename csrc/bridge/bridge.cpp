// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bridge.cpp
 * @brief Python-C++ nanobind bridge for TriLat core operations.
 *
 * Provides Python bindings for:
 *  - Sector construction (momentum, momentum + nup, unreduced)
 *  - Bond operators and correlators as COO dicts
 *  - Hamiltonian assembly from couplings
 *  - Bond / triangle site tables
 */

#include <nanobind/nanobind.h>
#include <nanobind/ndarray.h>
#include <nanobind/stl/optional.h>

#include <trilat/basis/bloch.hpp>
#include <trilat/lattice/bonds.hpp>
#include <trilat/operator/build_op.hpp>
#include <trilat/operator/sparse_utils.hpp>

#include <complex>
#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

using trilat::COOMatrix;
using trilat::Sector;
using trilat::u32;
using trilat::u64;

// NumPy array type aliases
using U32VecOut  = nb::ndarray<u32, nb::numpy, nb::shape<-1>>;
using U64VecOut  = nb::ndarray<u64, nb::numpy, nb::shape<-1>>;
using I32VecOut  = nb::ndarray<int32_t, nb::numpy, nb::shape<-1>>;
using C128VecOut = nb::ndarray<std::complex<double>, nb::numpy, nb::shape<-1>>;

// C++ → Python conversion utilities
template<class T>
[[nodiscard]] inline nb::capsule make_owner(T* p) {
    return nb::capsule(p, [](void* ptr) noexcept {
        delete[] static_cast<T*>(ptr);
    });
}

[[nodiscard]] inline U64VecOut from_u64_vector(const std::vector<u64>& xs) {
    const size_t N = xs.size();
    auto* data = new u64[N];
    if (N > 0) std::memcpy(data, xs.data(), N * sizeof(u64));
    return U64VecOut(data, {N}, make_owner(data));
}

[[nodiscard]] inline I32VecOut from_int_vector(const std::vector<int>& xs) {
    const size_t N = xs.size();
    auto* data = new int32_t[N];
    for (size_t i = 0; i < N; ++i) data[i] = static_cast<int32_t>(xs[i]);
    return I32VecOut(data, {N}, make_owner(data));
}

[[nodiscard]] inline nb::dict from_coo_matrix(const COOMatrix& coo) {
    const size_t M = coo.nnz();

    auto* row_data = new u32[M];
    auto* col_data = new u32[M];
    auto* val_data = new std::complex<double>[M];

    if (M > 0) {
        std::memcpy(row_data, coo.rows.data(), M * sizeof(u32));
        std::memcpy(col_data, coo.cols.data(), M * sizeof(u32));
        std::memcpy(val_data, coo.vals.data(), M * sizeof(std::complex<double>));
    }

    nb::dict d;
    d["row"]   = U32VecOut(row_data, {M}, make_owner(row_data));
    d["col"]   = U32VecOut(col_data, {M}, make_owner(col_data));
    d["val"]   = C128VecOut(val_data, {M}, make_owner(val_data));
    d["shape"] = nb::make_tuple(coo.n_rows, coo.n_cols);
    return d;
}

[[nodiscard]] inline nb::dict from_site_pairs(const trilat::SitePairs& p) {
    nb::dict d;
    d["site1"] = from_u64_vector(p.site1);
    d["site2"] = from_u64_vector(p.site2);
    return d;
}

// Module definition
NB_MODULE(_trilat_cpp, m) {
    m.doc() = "TriLat C++ core bridge";

    // Sector basis
    nb::class_<Sector>(m, "Sector", "Translation-symmetric sector basis")
        .def_static("momentum", &Sector::momentum,
                    "nx"_a, "ny"_a, "kx"_a, "ky"_a,
                    "Momentum sector over all configurations.")
        .def_static("momentum_nup", &Sector::momentum_nup,
                    "nx"_a, "ny"_a, "kx"_a, "ky"_a, "nup"_a,
                    "Momentum sector with fixed up-spin count.")
        .def_static("full_space", &Sector::full_space,
                    "nx"_a, "ny"_a, "nup"_a = nb::none(),
                    "Unreduced configuration basis.")
        .def_prop_ro("nx", &Sector::nx)
        .def_prop_ro("ny", &Sector::ny)
        .def_prop_ro("kx", &Sector::kx)
        .def_prop_ro("ky", &Sector::ky)
        .def_prop_ro("nup", &Sector::nup)
        .def("size", &Sector::size)
        .def("__len__", &Sector::size)
        .def("leads", [](const Sector& s) { return from_u64_vector(s.leads()); },
             "Representative configurations in index order.");

    // Bond operators
    m.def("h_ss_z",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::h_ss_z(s, l)); },
          "sector"_a, "l"_a = 1, "Σ S^z S^z over range-l bonds.");

    m.def("h_ss_xy",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::h_ss_xy(s, l)); },
          "sector"_a, "l"_a = 1, "Σ (S^+S^- + S^-S^+) over range-l bonds.");

    m.def("h_ss_ppmm",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::h_ss_ppmm(s, l)); },
          "sector"_a, "l"_a = 1, "Σ (γ S^+S^+ + γ* S^-S^-) over range-l bonds.");

    m.def("h_ss_pmz",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::h_ss_pmz(s, l)); },
          "sector"_a, "l"_a = 1, "Mixed +-z term over range-l bonds.");

    m.def("h_ss_chi",
          [](const Sector& s) { return from_coo_matrix(trilat::h_ss_chi(s)); },
          "sector"_a, "Scalar chirality over elementary triangles.");

    // Correlators
    m.def("ss_z",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::ss_z(s, l)); },
          "sector"_a, "l"_a, "Σ_r S^z_r S^z_{r+d(l)}.");

    m.def("ss_xy",
          [](const Sector& s, int l) { return from_coo_matrix(trilat::ss_xy(s, l)); },
          "sector"_a, "l"_a, "Σ_r (S^x S^x + S^y S^y) at separation l.");

    // Hamiltonian assembly
    m.def("build_hamiltonian",
          [](const Sector& s, double J_pm, double J_z, double J_ppmm,
             double J_pmz, double J2, double J3) {
              const trilat::Couplings c{
                  .J_pm = J_pm, .J_z = J_z, .J_ppmm = J_ppmm,
                  .J_pmz = J_pmz, .J2 = J2, .J3 = J3};
              return from_coo_matrix(trilat::build_hamiltonian(s, c));
          },
          "sector"_a, "J_pm"_a = 0.0, "J_z"_a = 0.0, "J_ppmm"_a = 0.0,
          "J_pmz"_a = 0.0, "J2"_a = 0.0, "J3"_a = 0.0,
          "Assemble the model Hamiltonian on a sector.");

    // Site tables
    m.def("interacting_sites",
          [](int nx, int ny, int l, bool unique) {
              return from_site_pairs(trilat::interacting_sites(nx, ny, l, unique));
          },
          "nx"_a, "ny"_a, "l"_a, "unique"_a = true,
          "Site masks of range-l bonds.");

    m.def("all_sites",
          [](int nx, int ny, int l) {
              return from_site_pairs(trilat::all_sites(nx, ny, l));
          },
          "nx"_a, "ny"_a, "l"_a,
          "Every site paired with its partner at separation l.");

    m.def("triangular_vert_sites",
          [](int nx, int ny) {
              const auto t = trilat::triangular_vert_sites(nx, ny);
              nb::dict d;
              d["site1"] = from_u64_vector(t.site1);
              d["site2"] = from_u64_vector(t.site2);
              d["site3"] = from_u64_vector(t.site3);
              d["orientation"] = from_int_vector(t.orientation);
              return d;
          },
          "nx"_a, "ny"_a,
          "Clockwise vertex masks of elementary triangles.");
} // NB_MODULE
