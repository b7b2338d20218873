/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/constants.h>
#include <cuspa/host/sparse_matrix.hpp>

#include <utility>
#include <vector>

namespace cuspa::host {

// A sparse vector stored as a list of nonzero coefficients and their indices
template <typename i_t, typename f_t>
class sparse_vector_t {
 public:
  sparse_vector_t() : n(0), i({}), x({}) {}
  // Construct a sparse vector of dimension n with nz nonzero coefficients
  sparse_vector_t(i_t n, i_t nz) : n(n), i(nz), x(nz) {}
  sparse_vector_t(i_t n, std::vector<i_t> i_in, std::vector<f_t> x_in)
    : n(n), i(std::move(i_in)), x(std::move(x_in))
  {
  }
  // convert a sparse vector into a CSC matrix with a single column
  void to_csc(csc_matrix_t<i_t, f_t>& A) const;
  // convert a sparse vector into a dense vector. Dense vector is cleared and resized.
  void to_dense(std::vector<f_t>& x_dense) const;
  // ensure the coefficients in the sparse vectory are sorted in terms of increasing index
  void sort();
  // Checks that indices are strictly increasing and within [0, n). Returns 0 or -1
  i_t check_vector() const;

  i_t nnz() const { return static_cast<i_t>(i.size()); }
  int device_id() const { return CUSPA_HOST_DEVICE_ID; }

  i_t n;
  std::vector<i_t> i;
  std::vector<f_t> x;
};

}  // namespace cuspa::host
