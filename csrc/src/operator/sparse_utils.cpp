// Copyright 2025 The TriLat Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file sparse_utils.cpp
 * @brief COO canonicalization and arithmetic.
 */

#include <trilat/operator/sparse_utils.hpp>
#include <trilat/utils/constants.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

namespace trilat {

f64 sort_and_merge_coo(COOMatrix& coo, f64 thresh) {
    const size_t n = coo.nnz();

    // (row, col) packed into one key orders entries row-major
    std::vector<std::pair<u64, size_t>> order(n);
    for (size_t k = 0; k < n; ++k) {
        order[k] = {(static_cast<u64>(coo.rows[k]) << 32) | coo.cols[k], k};
    }
    std::ranges::sort(order);

    COOMatrix merged;
    merged.reserve(n);
    merged.n_rows = coo.n_rows;
    merged.n_cols = coo.n_cols;

    f64 max_abs = 0.0;
    for (size_t i = 0; i < n; ) {
        const u64 key = order[i].first;
        cplx val{};
        for (; i < n && order[i].first == key; ++i) {
            val += coo.vals[order[i].second];
        }

        const f64 abs_val = std::abs(val);
        if (abs_val <= thresh) continue;
        max_abs = std::max(max_abs, abs_val);
        merged.push_back(static_cast<u32>(key >> 32), static_cast<u32>(key), val);
    }

    coo = std::move(merged);
    return max_abs;
}

COOMatrix coo_add(const COOMatrix& A, const COOMatrix& B, f64 thresh) {
    COOMatrix C;
    C.reserve(A.nnz() + B.nnz());
    C.n_rows = std::max(A.n_rows, B.n_rows);
    C.n_cols = std::max(A.n_cols, B.n_cols);

    auto emit = [&](u32 r, u32 c, cplx v) {
        if (std::abs(v) > thresh) C.push_back(r, c, v);
    };

    size_t i = 0, j = 0;
    const size_t m = A.nnz();
    const size_t n = B.nnz();

    while (i < m && j < n) {
        const u32 ra = A.rows[i], ca = A.cols[i];
        const u32 rb = B.rows[j], cb = B.cols[j];

        if (ra < rb || (ra == rb && ca < cb)) {
            emit(ra, ca, A.vals[i++]);
        } else if (rb < ra || (rb == ra && cb < ca)) {
            emit(rb, cb, B.vals[j++]);
        } else {
            emit(ra, ca, A.vals[i++] + B.vals[j++]);
        }
    }
    for (; i < m; ++i) emit(A.rows[i], A.cols[i], A.vals[i]);
    for (; j < n; ++j) emit(B.rows[j], B.cols[j], B.vals[j]);

    return C;
}

void coo_scale(COOMatrix& coo, cplx alpha) noexcept {
    for (auto& v : coo.vals) v *= alpha;
}

void merge_thread_local(std::vector<COOMatrix>& tl, COOMatrix& out) {
    size_t total = out.nnz();
    for (const auto& m : tl) total += m.nnz();

    out.reserve(total);

    for (auto& m : tl) {
        out.rows.insert(out.rows.end(), m.rows.begin(), m.rows.end());
        out.cols.insert(out.cols.end(), m.cols.begin(), m.cols.end());
        out.vals.insert(out.vals.end(), m.vals.begin(), m.vals.end());
        m.clear();
    }

    sort_and_merge_coo(out, MAT_ELEMENT_THRESH);
}

} // namespace trilat
