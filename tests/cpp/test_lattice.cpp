// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_lattice.cpp
 * @brief Unit tests for bit utilities, site geometry, translations and bond tables.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <trilat/lattice/bonds.hpp>
#include <trilat/lattice/site_vector.hpp>
#include <trilat/lattice/spin_config.hpp>
#include <trilat/utils/bit_utils.hpp>
#include <trilat/utils/constants.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <set>
#include <stdexcept>
#include <tuple>
#include <utility>
#include <vector>

using namespace trilat;
using Catch::Detail::Approx;

// -----------------------------------------------------------------------------
// Bit utilities sanity
// -----------------------------------------------------------------------------
TEST_CASE("Bit utils: popcount/ctz/masks", "[utils]") {
    REQUIRE(popcount(0b10101ULL) == 3);
    REQUIRE(popcount(0ULL) == 0);
    REQUIRE(ctz(0b10100ULL) == 2);
    REQUIRE(ctz(1ULL) == 0);

    REQUIRE(make_mask<u64>(0) == 0ULL);
    REQUIRE(make_mask<u64>(3) == 0b111ULL);
    REQUIRE(make_mask<u64>(64) == ~0ULL);

    REQUIRE(has_bits<u64>(0b1011ULL, 0b0011ULL));
    REQUIRE_FALSE(has_bits<u64>(0b1011ULL, 0b0100ULL));

    // Gosper: 0b0011 → 0b0101 → 0b0110 → 0b1001
    REQUIRE(next_combination<u64>(0b0011ULL) == 0b0101ULL);
    REQUIRE(next_combination<u64>(0b0101ULL) == 0b0110ULL);
    REQUIRE(next_combination<u64>(0b0110ULL) == 0b1001ULL);
}

// -----------------------------------------------------------------------------
// SiteVector
// -----------------------------------------------------------------------------
TEST_CASE("SiteVector: indexing and wraparound", "[lattice][site]") {
    SECTION("Coordinates wrap into the cell") {
        const SiteVector s(3, -1, 3, 3);
        REQUIRE(s.x() == 0);
        REQUIRE(s.y() == 2);
        REQUIRE(s.lattice_index() == 6);
        REQUIRE(s.mask() == (1ULL << 6));
    }

    SECTION("from_index inverts lattice_index") {
        for (int i = 0; i < 12; ++i) {
            REQUIRE(SiteVector::from_index(i, 4, 3).lattice_index() == i);
        }
        const auto s = SiteVector::from_index(5, 3, 3);
        REQUIRE(s.x() == 2);
        REQUIRE(s.y() == 1);
    }

    SECTION("Row-major traversal wraps to the origin") {
        SiteVector s(0, 0, 3, 2);
        for (int i = 1; i < 6; ++i) {
            s = s.next_site();
            REQUIRE(s.lattice_index() == i);
        }
        REQUIRE(s.next_site().lattice_index() == 0);
    }

    SECTION("Hops") {
        const SiteVector s(2, 1, 3, 3);
        REQUIRE(s.xhop(1) == SiteVector(0, 1, 3, 3));
        REQUIRE(s.yhop(-2) == SiteVector(2, 2, 3, 3));
    }

    SECTION("Invalid extents") {
        REQUIRE_THROWS_AS(SiteVector(0, 0, 0, 3), std::invalid_argument);
        REQUIRE_THROWS_AS(SiteVector(0, 0, 3, -1), std::invalid_argument);
        REQUIRE_THROWS_AS(SiteVector(0, 0, 9, 8), std::invalid_argument);
        REQUIRE_NOTHROW(SiteVector(0, 0, 8, 8));
        REQUIRE_THROWS_AS(SiteVector::from_index(9, 3, 3), std::out_of_range);
        REQUIRE_THROWS_AS(SiteVector::from_index(-1, 3, 3), std::out_of_range);
    }
}

TEST_CASE("SiteVector: neighbor shells", "[lattice][site]") {
    SECTION("Nearest neighbors on 3x3") {
        const SiteVector o(0, 0, 3, 3);
        const auto nn = o.nearest_neighboring_sites();
        REQUIRE(nn.size() == 3);
        REQUIRE(nn[0].lattice_index() == 1);  // (1, 0)
        REQUIRE(nn[1].lattice_index() == 5);  // (2, 1)
        REQUIRE(nn[2].lattice_index() == 6);  // (0, 2)
    }

    SECTION("Hops onto the origin are skipped") {
        const SiteVector o(0, 0, 4, 1);
        REQUIRE(o.nearest_neighboring_sites().size() == 2);
        REQUIRE(o.third_neighboring_sites().size() == 2);
        REQUIRE(SiteVector(0, 0, 1, 1).nearest_neighboring_sites().empty());
    }

    SECTION("Second and third shells on 4x4") {
        const SiteVector o(0, 0, 4, 4);
        const auto nnn = o.second_neighboring_sites();
        REQUIRE(nnn.size() == 3);
        REQUIRE(nnn[0] == SiteVector(1, 1, 4, 4));
        REQUIRE(nnn[1] == SiteVector(2, 1, 4, 4));
        REQUIRE(nnn[2] == SiteVector(1, 2, 4, 4));

        const auto third = o.third_neighboring_sites();
        REQUIRE(third.size() == 3);
        REQUIRE(third[0] == SiteVector(2, 0, 4, 4));
        REQUIRE(third[1] == SiteVector(2, 2, 4, 4));
        REQUIRE(third[2] == SiteVector(0, 2, 4, 4));
    }

    SECTION("Range dispatch") {
        const SiteVector o(1, 1, 4, 4);
        REQUIRE(o.neighboring_sites(2) == o.second_neighboring_sites());
        REQUIRE_THROWS_AS(o.neighboring_sites(0), std::invalid_argument);
        REQUIRE_THROWS_AS(o.neighboring_sites(4), std::invalid_argument);
    }
}

TEST_CASE("SiteVector: displacement and bond angle", "[lattice][site]") {
    SECTION("Minimal image lies in (-n/2, n/2]") {
        const SiteVector a(0, 0, 4, 4);
        REQUIRE(a.displacement(SiteVector(3, 2, 4, 4)) == std::make_pair(-1, 2));
        REQUIRE(a.displacement(SiteVector(2, 1, 4, 4)) == std::make_pair(2, 1));
        REQUIRE(SiteVector(2, 3, 5, 5).displacement(SiteVector(0, 0, 5, 5)) == std::make_pair(-2, 2));
    }

    SECTION("Nearest-neighbor directions") {
        const SiteVector o(1, 1, 3, 3);
        const auto nn = o.nearest_neighboring_sites();
        REQUIRE(o.angle_with(nn[0]) == Approx(0.0));
        REQUIRE(o.angle_with(nn[1]) == Approx(BOND_ANGLE));
        REQUIRE(o.angle_with(nn[2]) == Approx(-BOND_ANGLE));
    }

    SECTION("Antisymmetric for every pair, including half-period ties") {
        for (auto [nx, ny] : {std::pair{3, 3}, std::pair{4, 4}, std::pair{2, 4}}) {
            for (int i = 0; i < nx * ny; ++i) {
                for (int j = 0; j < nx * ny; ++j) {
                    const auto a = SiteVector::from_index(i, nx, ny);
                    const auto b = SiteVector::from_index(j, nx, ny);
                    REQUIRE(a.angle_with(b) == Approx(-b.angle_with(a)).margin(1e-14));
                }
            }
        }
    }
}

// -----------------------------------------------------------------------------
// Configuration translations and pair classes
// -----------------------------------------------------------------------------
TEST_CASE("Translations of configuration words", "[lattice][translate]") {
    SECTION("Single sites move as (x+1, y) and (x, y-1)") {
        // 3x3: site 0 → site 1, site 2 → site 0
        REQUIRE(translate_x(0b1ULL, 3, 3) == 0b10ULL);
        REQUIRE(translate_x(0b100ULL, 3, 3) == 0b1ULL);
        // 3x3: site 3 (0,1) → site 0, site 0 → site 6 (0,2)
        REQUIRE(translate_y(1ULL << 3, 3, 3) == 1ULL);
        REQUIRE(translate_y(1ULL, 3, 3) == (1ULL << 6));
        REQUIRE(translate(1ULL, Axis::X, 3, 3) == translate_x(1ULL, 3, 3));
        REQUIRE(translate(1ULL, Axis::Y, 3, 3) == translate_y(1ULL, 3, 3));
    }

    SECTION("Periodicity and commutation") {
        const std::array<std::pair<int, int>, 4> dims = {{{3, 4}, {4, 1}, {1, 5}, {8, 8}}};
        const std::array<u64, 4> decs = {0x5ULL, 0x9A3ULL, 0x1ULL, 0xF0F0123456789ULL};

        for (auto [nx, ny] : dims) {
            const u64 full = make_mask<u64>(nx * ny);
            for (u64 d : decs) {
                const u64 dec = d & full;

                u64 tx = dec;
                for (int i = 0; i < nx; ++i) tx = translate_x(tx, nx, ny);
                REQUIRE(tx == dec);

                u64 ty = dec;
                for (int i = 0; i < ny; ++i) ty = translate_y(ty, nx, ny);
                REQUIRE(ty == dec);

                REQUIRE(translate_x(translate_y(dec, nx, ny), nx, ny) ==
                        translate_y(translate_x(dec, nx, ny), nx, ny));
                REQUIRE(popcount(translate_x(dec, nx, ny)) == popcount(dec));
                REQUIRE((translate_y(dec, nx, ny) & ~full) == 0);
            }
        }
    }
}

TEST_CASE("Pair classes are exclusive", "[lattice][pairs]") {
    for (u64 dec = 0; dec < 16; ++dec) {
        for (int i = 0; i < 4; ++i) {
            for (int j = 0; j < 4; ++j) {
                const u64 s1 = 1ULL << i;
                const u64 s2 = 1ULL << j;
                const auto [updown, downup] = exchange_spin_flips(dec, s1, s2);
                const auto [upup, downdown] = repeated_spins(dec, s1, s2);
                REQUIRE(int(updown) + int(downup) + int(upup) + int(downdown) == 1);
                if (i == j) {
                    REQUIRE_FALSE(updown);
                    REQUIRE_FALSE(downup);
                }
            }
        }
    }

    const auto [updown, downup] = exchange_spin_flips(0b01ULL, 0b01ULL, 0b10ULL);
    REQUIRE(updown);
    REQUIRE_FALSE(downup);
}

// -----------------------------------------------------------------------------
// Bonds, site pairs, triangles
// -----------------------------------------------------------------------------
TEST_CASE("generate_bonds: counts and dedup policy", "[lattice][bonds]") {
    SECTION("4x1 chain") {
        const auto unique = generate_bonds(4, 1);
        REQUIRE(unique.by_range(1).size() == 4);
        const auto raw = generate_bonds(4, 1, false);
        REQUIRE(raw.by_range(1).size() == 8);
    }

    SECTION("4x4 third neighbors coincide with their reverse") {
        REQUIRE(generate_bonds(4, 4).by_range(3).size() == 24);
        REQUIRE(generate_bonds(4, 4, false).by_range(3).size() == 48);
        REQUIRE(generate_bonds(4, 4).by_range(1).size() == 48);
    }

    SECTION("3x3 nearest neighbors are all distinct") {
        REQUIRE(generate_bonds(3, 3).by_range(1).size() == 27);
        // b1, b2, b3 are the same vector mod 3
        REQUIRE(generate_bonds(3, 3).by_range(2).size() == 9);
        REQUIRE(generate_bonds(3, 3, false).by_range(2).size() == 27);
    }

    SECTION("Bonds keep hop orientation and compare unordered") {
        const auto bonds = generate_bonds(3, 3).by_range(1);
        REQUIRE(bonds[0].first.lattice_index() == 0);
        REQUIRE(bonds[0].second.lattice_index() == 1);

        const Bond fwd{SiteVector(0, 0, 3, 3), SiteVector(1, 0, 3, 3)};
        const Bond rev{SiteVector(1, 0, 3, 3), SiteVector(0, 0, 3, 3)};
        REQUIRE(fwd == rev);

        std::set<std::pair<int, int>> pairs;
        for (const auto& b : bonds) {
            pairs.insert(std::minmax({b.first.lattice_index(), b.second.lattice_index()}));
        }
        REQUIRE(pairs.size() == bonds.size());
    }

    SECTION("Dedup keeps exactly one bond per distinct site pair") {
        for (auto [nx, ny] : {std::pair{3, 3}, std::pair{4, 1}, std::pair{4, 4}, std::pair{5, 3}}) {
            const auto unique = generate_bonds(nx, ny);
            const auto raw = generate_bonds(nx, ny, false);
            for (int l = 1; l <= 3; ++l) {
                std::set<std::pair<int, int>> distinct;
                for (const auto& b : raw.by_range(l)) {
                    distinct.insert(std::minmax({b.first.lattice_index(), b.second.lattice_index()}));
                }
                INFO(nx << "x" << ny << " range " << l);
                REQUIRE(unique.by_range(l).size() == distinct.size());
            }
        }
        REQUIRE(generate_bonds(3, 3).by_range(3).size() == 27);
        REQUIRE(interacting_sites(4, 1, 1).size() == 4);
    }

    SECTION("Invalid range") {
        REQUIRE_THROWS_AS(generate_bonds(3, 3).by_range(0), std::invalid_argument);
    }
}

TEST_CASE("interacting_sites and all_sites", "[lattice][bonds]") {
    SECTION("Bond masks follow bond order") {
        const auto sites = interacting_sites(3, 3, 1);
        const auto bonds = generate_bonds(3, 3).by_range(1);
        REQUIRE(sites.size() == bonds.size());
        for (size_t k = 0; k < sites.size(); ++k) {
            REQUIRE(sites.site1[k] == bonds[k].first.mask());
            REQUIRE(sites.site2[k] == bonds[k].second.mask());
            REQUIRE(popcount(sites.site1[k]) == 1);
        }
        REQUIRE(interacting_sites(4, 1, 1, false).size() == 8);
        REQUIRE_THROWS_AS(interacting_sites(3, 3, 4), std::invalid_argument);
    }

    SECTION("Separation l maps to (l % nx, l / nx)") {
        const auto pairs = all_sites(3, 3, 4);
        REQUIRE(pairs.size() == 9);
        REQUIRE(pairs.site1[0] == 1ULL);
        REQUIRE(pairs.site2[0] == (1ULL << 4));
        // (2, 2) + (1, 1) → (0, 0)
        REQUIRE(pairs.site1[8] == (1ULL << 8));
        REQUIRE(pairs.site2[8] == 1ULL);

        const auto self = all_sites(3, 3, 0);
        REQUIRE(self.site1 == self.site2);

        REQUIRE_THROWS_AS(all_sites(3, 3, 9), std::invalid_argument);
        REQUIRE_THROWS_AS(all_sites(3, 3, -1), std::invalid_argument);
    }
}

TEST_CASE("triangular_vert_sites", "[lattice][triangles]") {
    SECTION("2x2 gives 8 distinct clockwise triangles") {
        const auto t = triangular_vert_sites(2, 2);
        REQUIRE(t.size() == 8);

        std::set<std::tuple<u64, u64, u64>> seen;
        int net_orientation = 0;
        for (size_t k = 0; k < t.size(); ++k) {
            seen.emplace(t.site1[k], t.site2[k], t.site3[k]);
            net_orientation += t.orientation[k];
            REQUIRE(popcount(t.site1[k] | t.site2[k] | t.site3[k]) == 3);
        }
        REQUIRE(seen.size() == 8);
        REQUIRE(net_orientation == 0);
    }

    SECTION("Vertex layout of the first cell on 3x3") {
        const auto t = triangular_vert_sites(3, 3);
        REQUIRE(t.size() == 18);
        // Upward: (0,0), (0,1), (1,0)
        REQUIRE(t.site1[0] == 1ULL);
        REQUIRE(t.site2[0] == (1ULL << 3));
        REQUIRE(t.site3[0] == (1ULL << 1));
        REQUIRE(t.orientation[0] == 1);
        // Downward: (0,1), (1,1), (1,0)
        REQUIRE(t.site1[1] == (1ULL << 3));
        REQUIRE(t.site2[1] == (1ULL << 4));
        REQUIRE(t.site3[1] == (1ULL << 1));
        REQUIRE(t.orientation[1] == -1);
    }
}

TEST_CASE("gamma: unit modulus and conjugation", "[lattice][gamma]") {
    for (auto [nx, ny] : {std::pair{3, 3}, std::pair{4, 4}, std::pair{4, 1}}) {
        for (int i = 0; i < nx * ny; ++i) {
            for (int j = 0; j < nx * ny; ++j) {
                const u64 s1 = 1ULL << i;
                const u64 s2 = 1ULL << j;
                const cplx g = gamma(nx, ny, s1, s2);
                const cplx h = gamma(nx, ny, s2, s1);
                REQUIRE(std::abs(g) == Approx(1.0));
                REQUIRE(std::abs(g - std::conj(h)) < 1e-14);
            }
        }
    }

    // a1 along x carries no phase, a2 carries e^{2πi/3}
    REQUIRE(std::abs(gamma(3, 3, 1ULL, 1ULL << 1) - cplx(1.0, 0.0)) < 1e-14);
    REQUIRE(std::abs(gamma(3, 3, 1ULL, 1ULL << 5) - std::polar(1.0, BOND_ANGLE)) < 1e-14);
}
