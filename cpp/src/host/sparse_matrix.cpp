/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/host/sparse_matrix.hpp>
#include <cuspa/logger.hpp>

#include <cassert>
#include <cstdint>
#include <cstdio>
#include <vector>

namespace cuspa::host {

template <typename i_t, typename f_t>
void csc_matrix_t<i_t, f_t>::reallocate(i_t new_nz)
{
  this->i.resize(new_nz);
  this->x.resize(new_nz);
  this->nz_max = new_nz;
}

template <typename i_t>
void cumulative_sum(std::vector<i_t>& inout, std::vector<i_t>& output)
{
  i_t n = inout.size();
  assert(output.size() == n + 1);
  i_t nz = 0;
  for (i_t i = 0; i < n; ++i) {
    output[i] = nz;
    nz += inout[i];
    inout[i] = output[i];
  }
  output[n] = nz;
}

template <typename i_t, typename f_t>
i_t coo_to_csc(const std::vector<i_t>& Ai,
               const std::vector<i_t>& Aj,
               const std::vector<f_t>& Ax,
               csc_matrix_t<i_t, f_t>& A)
{
  if (Ai.size() != Aj.size() || Aj.size() != Ax.size()) {
    CUSPA_LOG_ERROR("COO error: triplet arrays differ in length (%zu, %zu, %zu)",
                    Ai.size(),
                    Aj.size(),
                    Ax.size());
    return -1;
  }
  const i_t n  = A.n;
  const i_t nz = Aj.size();
  A.col_start.resize(n + 1);
  if (A.nz_max != nz) { A.reallocate(nz); }

  std::vector<i_t> workspace(n, 0);

  // Get the column counts
  for (i_t k = 0; k < nz; ++k) {
    if (Aj[k] < 0 || Aj[k] >= n) {
      CUSPA_LOG_ERROR("COO error: column index %lld not in range [0, %lld)",
                      static_cast<long long>(Aj[k]),
                      static_cast<long long>(n));
      return -1;
    }
    workspace[Aj[k]]++;
  }

  cumulative_sum(workspace, A.col_start);
  for (i_t k = 0; k < nz; ++k) {
    i_t p  = workspace[Aj[k]]++;
    A.i[p] = Ai[k];
    A.x[p] = Ax[k];
  }

  assert(A.col_start[n] == nz);
  return 0;
}

template <typename i_t>
std::vector<i_t> expand_row_pointers(const std::vector<i_t>& pointers)
{
  if (pointers.empty()) { return {}; }
  const i_t rows = static_cast<i_t>(pointers.size()) - 1;
  std::vector<i_t> labels;
  if (pointers[rows] > pointers[0]) { labels.reserve(pointers[rows] - pointers[0]); }
  for (i_t r = 0; r < rows; ++r) {
    for (i_t p = pointers[r]; p < pointers[r + 1]; ++p) {
      labels.push_back(r);
    }
  }
  return labels;
}

template <typename i_t, typename f_t>
i_t csc_matrix_t<i_t, f_t>::to_compressed_row(csr_matrix_t<i_t, f_t>& Arow) const
{
  i_t m = Arow.m = this->m;
  i_t n = Arow.n = this->n;
  i_t nz         = this->col_start[n];
  Arow.nz_max    = nz;
  Arow.row_start.resize(m + 1);
  Arow.j.resize(nz);
  Arow.x.resize(nz);

  std::vector<i_t> workspace(m, 0);
  for (i_t p = 0; p < nz; ++p) {
    workspace[this->i[p]]++;
  }
  cumulative_sum(workspace, Arow.row_start);
  for (i_t j = 0; j < n; ++j) {
    i_t col_start = this->col_start[j];
    i_t col_end   = this->col_start[j + 1];
    for (i_t p = col_start; p < col_end; ++p) {
      i_t q     = workspace[this->i[p]]++;
      Arow.j[q] = j;
      Arow.x[q] = this->x[p];
    }
  }
  assert(Arow.row_start[m] == nz);
  return 0;
}

template <typename i_t, typename f_t>
i_t csr_matrix_t<i_t, f_t>::to_compressed_col(csc_matrix_t<i_t, f_t>& Acol) const
{
  i_t m = Acol.m = this->m;
  i_t n = Acol.n = this->n;
  i_t nz         = this->row_start[m];
  Acol.nz_max    = nz;
  Acol.col_start.resize(n + 1);
  Acol.i.resize(nz);
  Acol.x.resize(nz);

  std::vector<i_t> workspace(n, 0);
  for (i_t p = 0; p < nz; ++p) {
    workspace[this->j[p]]++;
  }
  cumulative_sum(workspace, Acol.col_start);
  for (i_t i = 0; i < m; ++i) {
    i_t row_start = this->row_start[i];
    i_t row_end   = this->row_start[i + 1];
    for (i_t p = row_start; p < row_end; ++p) {
      i_t q     = workspace[this->j[p]]++;
      Acol.i[q] = i;
      Acol.x[q] = this->x[p];
    }
  }
  assert(Acol.col_start[n] == nz);
  return 0;
}

namespace {

// Shared by the CSC and CSR checks: `outer` compressed slices of `inner` extent
template <typename i_t>
i_t check_compressed(const char* format,
                     i_t outer,
                     i_t inner,
                     const std::vector<i_t>& pointers,
                     const std::vector<i_t>& indices)
{
  if (pointers.size() != static_cast<size_t>(outer) + 1 || pointers[0] != 0) {
    CUSPA_LOG_ERROR("%s error: pointer array of size %zu for %lld slices",
                    format,
                    pointers.size(),
                    static_cast<long long>(outer));
    return -1;
  }
  if (indices.size() < static_cast<size_t>(pointers[outer])) {
    CUSPA_LOG_ERROR("%s error: %zu indices for %lld entries",
                    format,
                    indices.size(),
                    static_cast<long long>(pointers[outer]));
    return -1;
  }
  for (i_t k = 0; k < outer; ++k) {
    const i_t start = pointers[k];
    const i_t end   = pointers[k + 1];
    if (start < 0 || start > end || end > pointers[outer] ||
        static_cast<size_t>(end) > indices.size()) {
      CUSPA_LOG_ERROR("%s error: pointers. start %lld end %lld in slice %lld",
                      format,
                      static_cast<long long>(start),
                      static_cast<long long>(end),
                      static_cast<long long>(k));
      return -1;
    }
    for (i_t p = start; p < end; ++p) {
      const i_t idx = indices[p];
      if (idx < 0 || idx >= inner) {
        CUSPA_LOG_ERROR("%s error: index %lld not in range [0, %lld)",
                        format,
                        static_cast<long long>(idx),
                        static_cast<long long>(inner));
        return -1;
      }
      if (p > start && indices[p - 1] >= idx) {
        CUSPA_LOG_ERROR("%s error: indices not strictly increasing in slice %lld",
                        format,
                        static_cast<long long>(k));
        return -1;
      }
    }
  }
  return 0;
}

}  // namespace

template <typename i_t, typename f_t>
i_t csc_matrix_t<i_t, f_t>::check_matrix() const
{
  return check_compressed<i_t>("CSC", this->n, this->m, this->col_start, this->i);
}

template <typename i_t, typename f_t>
i_t csr_matrix_t<i_t, f_t>::check_matrix() const
{
  return check_compressed<i_t>("CSR", this->m, this->n, this->row_start, this->j);
}

template <typename i_t, typename f_t>
void csc_matrix_t<i_t, f_t>::print_matrix(FILE* fid) const
{
  fprintf(fid, "ijx = [\n");
  for (i_t j = 0; j < this->n; ++j) {
    i_t p2 = this->col_start[j + 1];
    for (i_t p = this->col_start[j]; p < p2; ++p) {
      fprintf(fid,
              "%lld %lld %.16e;\n",
              static_cast<long long>(this->i[p]) + 1,
              static_cast<long long>(j) + 1,
              static_cast<double>(this->x[p]));
    }
  }
  fprintf(fid, "];\n");
  fprintf(fid,
          "A = sparse(ijx(:, 1), ijx(:, 2), ijx(:, 3), %lld, %lld);\n",
          static_cast<long long>(this->m),
          static_cast<long long>(this->n));
}

template <typename i_t, typename f_t>
void csc_matrix_t<i_t, f_t>::print_matrix() const
{
  this->print_matrix(stdout);
}

template void cumulative_sum<int>(std::vector<int>& inout, std::vector<int>& output);
template void cumulative_sum<int64_t>(std::vector<int64_t>& inout, std::vector<int64_t>& output);

template std::vector<int> expand_row_pointers<int>(const std::vector<int>& pointers);
template std::vector<int64_t> expand_row_pointers<int64_t>(const std::vector<int64_t>& pointers);

#define INSTANTIATE_HOST_SPARSE_MATRIX(I_T, F_T)                          \
  template class csc_matrix_t<I_T, F_T>;                                  \
  template class csr_matrix_t<I_T, F_T>;                                  \
  template I_T coo_to_csc<I_T, F_T>(const std::vector<I_T>& Ai,           \
                                    const std::vector<I_T>& Aj,           \
                                    const std::vector<F_T>& Ax,           \
                                    csc_matrix_t<I_T, F_T>& A);

#if CUSPA_INSTANTIATE_FLOAT
INSTANTIATE_HOST_SPARSE_MATRIX(int, float)
INSTANTIATE_HOST_SPARSE_MATRIX(int64_t, float)
#endif

#if CUSPA_INSTANTIATE_DOUBLE
INSTANTIATE_HOST_SPARSE_MATRIX(int, double)
INSTANTIATE_HOST_SPARSE_MATRIX(int64_t, double)
#endif

#undef INSTANTIATE_HOST_SPARSE_MATRIX

}  // namespace cuspa::host
