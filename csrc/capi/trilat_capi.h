/* Copyright 2025 The TriLat Authors - All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

/**
 * @file trilat_capi.h
 * @brief C ABI for symmetry-reduced triangular-lattice operator matrices.
 *
 * Every builder returns a coordinate matrix whose three buffers are owned
 * by the caller and must be released exactly once with
 * trilat_request_free(). On invalid input a builder returns an empty
 * matrix (null buffers, zero extents) and trilat_last_error() describes
 * the failure; after a successful call it returns NULL.
 *
 * Matrix convention: data[k] = <col[k]|O|row[k]> in the sector basis.
 */

#ifndef TRILAT_CAPI_H
#define TRILAT_CAPI_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct {
    double re;
    double im;
} TrilatComplex;

typedef struct {
    TrilatComplex* ptr;
    size_t len;
} TrilatComplexVec;

typedef struct {
    uint32_t* ptr;
    size_t len;
} TrilatIndexVec;

typedef struct {
    TrilatComplexVec data;
    TrilatIndexVec col;
    TrilatIndexVec row;
    uint32_t ncols;
    uint32_t nrows;
} TrilatCoordMatrix;

/* Momentum sector (kx, ky) */
TrilatCoordMatrix trilat_k_h_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);
TrilatCoordMatrix trilat_k_h_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);
TrilatCoordMatrix trilat_k_h_ss_ppmm(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);
TrilatCoordMatrix trilat_k_h_ss_pmz(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);
TrilatCoordMatrix trilat_k_h_ss_chi(int32_t nx, int32_t ny, int32_t kx, int32_t ky);
TrilatCoordMatrix trilat_k_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);
TrilatCoordMatrix trilat_k_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t l);

/* Momentum sector (kx, ky) with nup up spins */
TrilatCoordMatrix trilat_ks_h_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);
TrilatCoordMatrix trilat_ks_h_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);
TrilatCoordMatrix trilat_ks_h_ss_ppmm(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);
TrilatCoordMatrix trilat_ks_h_ss_pmz(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);
TrilatCoordMatrix trilat_ks_h_ss_chi(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup);
TrilatCoordMatrix trilat_ks_ss_z(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);
TrilatCoordMatrix trilat_ks_ss_xy(int32_t nx, int32_t ny, int32_t kx, int32_t ky, int32_t nup, int32_t l);

/* Releases the three buffers of a matrix returned above. Not idempotent. */
void trilat_request_free(TrilatCoordMatrix matrix);

/* Message of the last failed call on this thread, NULL after success. */
const char* trilat_last_error(void);

#ifdef __cplusplus
} /* extern "C" */
#endif

#endif /* TRILAT_CAPI_H */
