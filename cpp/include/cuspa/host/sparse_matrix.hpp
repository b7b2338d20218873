/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/constants.h>

#include <cstdio>
#include <type_traits>
#include <utility>
#include <vector>

namespace cuspa::host {

template <typename i_t, typename f_t>
class csr_matrix_t;  // Forward declaration of CSR matrix needed to define CSC
                     // matrix

// A host resident sparse matrix stored in compressed sparse column format
template <typename i_t, typename f_t>
class csc_matrix_t {
 public:
  csc_matrix_t() : m(0), n(0), nz_max(0), col_start(1, 0) {}

  csc_matrix_t(i_t rows, i_t cols, i_t nz)
    : m(rows), n(cols), nz_max(nz), col_start(n + 1), i(nz_max), x(nz_max)
  {
  }

  csc_matrix_t(i_t rows,
               i_t cols,
               std::vector<i_t> col_start_in,
               std::vector<i_t> i_in,
               std::vector<f_t> x_in)
    : m(rows),
      n(cols),
      nz_max(static_cast<i_t>(x_in.size())),
      col_start(std::move(col_start_in)),
      i(std::move(i_in)),
      x(std::move(x_in))
  {
  }

  // Adjust to i and x vectors for a new number of nonzeros
  void reallocate(i_t new_nz);

  // Number of stored entries, col_start[n]
  i_t nnz() const { return col_start.empty() ? 0 : col_start[n]; }

  // Convert the CSC matrix to a CSR matrix
  i_t to_compressed_row(csr_matrix_t<i_t, f_t>& Arow) const;

  // Checks pointer monotonicity, index range and strictly increasing row indices
  // within each column. Returns 0 on success and -1 on the first violation
  i_t check_matrix() const;

  // Prints the matrix to stdout
  void print_matrix() const;

  // Prints the matrix to a file
  void print_matrix(FILE* fid) const;

  int device_id() const { return CUSPA_HOST_DEVICE_ID; }

  i_t m;                       // number of rows
  i_t n;                       // number of columns
  i_t nz_max;                  // maximum number of entries
  std::vector<i_t> col_start;  // column pointers (size n + 1)
  std::vector<i_t> i;          // row indices, size nz_max
  std::vector<f_t> x;          // numerical values, size nz_max

  static_assert(std::is_signed_v<i_t>);  // Require signed integers
};

// A host resident sparse matrix stored in compressed sparse row format
template <typename i_t, typename f_t>
class csr_matrix_t {
 public:
  csr_matrix_t() : nz_max(0), m(0), n(0), row_start(1, 0) {}

  csr_matrix_t(i_t rows, i_t cols, i_t nz)
    : nz_max(nz), m(rows), n(cols), row_start(m + 1), j(nz_max), x(nz_max)
  {
  }

  csr_matrix_t(i_t rows,
               i_t cols,
               std::vector<i_t> row_start_in,
               std::vector<i_t> j_in,
               std::vector<f_t> x_in)
    : nz_max(static_cast<i_t>(x_in.size())),
      m(rows),
      n(cols),
      row_start(std::move(row_start_in)),
      j(std::move(j_in)),
      x(std::move(x_in))
  {
  }

  i_t nnz() const { return row_start.empty() ? 0 : row_start[m]; }

  // Convert the CSR matrix to CSC
  i_t to_compressed_col(csc_matrix_t<i_t, f_t>& Acol) const;

  // Checks pointer monotonicity, index range and strictly increasing column
  // indices within each row. Returns 0 on success and -1 on the first violation
  i_t check_matrix() const;

  int device_id() const { return CUSPA_HOST_DEVICE_ID; }

  i_t nz_max;                  // maximum number of nonzero entries
  i_t m;                       // number of rows
  i_t n;                       // number of cols
  std::vector<i_t> row_start;  // row pointers (size m + 1)
  std::vector<i_t> j;          // column indices, size nz_max
  std::vector<f_t> x;          // numerical values, size nz_max

  static_assert(std::is_signed_v<i_t>);
};

template <typename i_t>
void cumulative_sum(std::vector<i_t>& inout, std::vector<i_t>& output);

// Assembles A from (Ai[k], Aj[k], Ax[k]) triplets. A.m and A.n must be set.
// Entries of a column keep the order in which they appear in the triplets
template <typename i_t, typename f_t>
i_t coo_to_csc(const std::vector<i_t>& Ai,
               const std::vector<i_t>& Aj,
               const std::vector<f_t>& Ax,
               csc_matrix_t<i_t, f_t>& A);

// Expands compressed pointers into one explicit label per entry: label r is
// repeated pointers[r + 1] - pointers[r] times
template <typename i_t>
std::vector<i_t> expand_row_pointers(const std::vector<i_t>& pointers);

}  // namespace cuspa::host
