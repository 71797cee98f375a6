// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sparse_utils.hpp
 * @brief Complex coordinate-format matrices for sector operators.
 *
 * Convention: row = origin state, col = destination state, so that
 * M[i][j] = ⟨j|O|i⟩ in the sector basis.
 */

#pragma once

#include <trilat/utils/types.hpp>

#include <vector>

namespace trilat {

/**
 * Coordinate (COO) format: unsorted triplets (row, col, val).
 * May contain duplicates; use sort_and_merge_coo() to canonicalize.
 */
struct COOMatrix {
    std::vector<u32>  rows;
    std::vector<u32>  cols;
    std::vector<cplx> vals;
    u32 n_rows = 0;
    u32 n_cols = 0;

    [[nodiscard]] size_t nnz() const noexcept { return vals.size(); }
    [[nodiscard]] bool empty() const noexcept { return vals.empty(); }

    void reserve(size_t n) {
        rows.reserve(n);
        cols.reserve(n);
        vals.reserve(n);
    }

    void push_back(u32 r, u32 c, cplx v) {
        rows.push_back(r);
        cols.push_back(c);
        vals.push_back(v);
    }

    void clear() {
        rows.clear();
        cols.clear();
        vals.clear();
    }
};

// ============================================================================
// COO Matrix Operations
// ============================================================================

/**
 * Canonicalize COO matrix: sort by (row, col), sum duplicates, then drop
 * merged entries with |val| ≤ thresh.
 *
 * @return Maximum absolute value of the kept entries
 */
f64 sort_and_merge_coo(COOMatrix& coo, f64 thresh = 0.0);

/**
 * Matrix addition C = A + B for sorted COO matrices.
 *
 * Algorithm: Two-pointer merge (O(nnz_A + nnz_B) time).
 *
 * @param thresh Drop elements with |val| ≤ thresh
 * @return       Sum matrix (sorted, unique entries)
 */
[[nodiscard]] COOMatrix coo_add(
    const COOMatrix& A,
    const COOMatrix& B,
    f64 thresh = 0.0
);

/// In-place scaling M ← alpha·M.
void coo_scale(COOMatrix& coo, cplx alpha) noexcept;

/**
 * Merge thread-local sinks into one canonical matrix, dropping entries
 * with |val| ≤ MAT_ELEMENT_THRESH after summation.
 * Output is independent of how rows were distributed across sinks.
 */
void merge_thread_local(std::vector<COOMatrix>& tl, COOMatrix& out);

} // namespace trilat
