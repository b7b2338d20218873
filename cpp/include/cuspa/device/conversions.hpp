/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/device/csc_matrix.hpp>
#include <cuspa/device/csr_matrix.hpp>
#include <cuspa/device/hyb_matrix.hpp>

namespace cuspa {

/**
 * @brief Converts a CSC matrix to CSR with `cusparseCsr2cscEx2`.
 *
 * The work is enqueued on the stream of the handle `A` was created with, the result belongs to
 * the same handle.
 */
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t> to_csr(csc_matrix_t<i_t, f_t> const& A);

/**
 * @brief Converts a CSR matrix to CSC with `cusparseCsr2cscEx2`.
 */
template <typename i_t, typename f_t>
csc_matrix_t<i_t, f_t> to_csc(csr_matrix_t<i_t, f_t> const& A);

/**
 * @brief Builds a hybrid matrix from a CSR matrix.
 *
 * The CSR buffers are duplicated into storage owned by the new payload, `A` can be released
 * afterwards.
 */
template <typename i_t, typename f_t>
hyb_matrix_t<i_t, f_t> to_hyb(csr_matrix_t<i_t, f_t> const& A);

}  // namespace cuspa
