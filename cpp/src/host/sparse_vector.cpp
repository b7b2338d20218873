/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/host/sparse_vector.hpp>
#include <cuspa/logger.hpp>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace cuspa::host {

template <typename i_t, typename f_t>
void sparse_vector_t<i_t, f_t>::to_csc(csc_matrix_t<i_t, f_t>& A) const
{
  A.m      = n;
  A.n      = 1;
  A.nz_max = i.size();
  A.col_start.resize(2);
  A.col_start[0] = 0;
  A.col_start[1] = i.size();
  A.i            = i;
  A.x            = x;
}

template <typename i_t, typename f_t>
void sparse_vector_t<i_t, f_t>::to_dense(std::vector<f_t>& x_dense) const
{
  x_dense.clear();
  x_dense.resize(n, f_t{0});
  const i_t nz = i.size();
  for (i_t k = 0; k < nz; ++k) {
    x_dense[i[k]] = x[k];
  }
}

template <typename i_t, typename f_t>
void sparse_vector_t<i_t, f_t>::sort()
{
  const i_t nz = i.size();
  std::vector<i_t> i_sorted(nz);
  std::vector<f_t> x_sorted(nz);
  std::vector<i_t> perm(nz);
  for (i_t k = 0; k < nz; ++k) {
    perm[k] = k;
  }
  std::vector<i_t>& iunsorted = i;
  std::sort(
    perm.begin(), perm.end(), [&iunsorted](i_t a, i_t b) { return iunsorted[a] < iunsorted[b]; });
  for (i_t k = 0; k < nz; ++k) {
    i_sorted[k] = i[perm[k]];
    x_sorted[k] = x[perm[k]];
  }
  i = std::move(i_sorted);
  x = std::move(x_sorted);
}

template <typename i_t, typename f_t>
i_t sparse_vector_t<i_t, f_t>::check_vector() const
{
  if (i.size() != x.size()) {
    CUSPA_LOG_ERROR("Sparse vector error: %zu indices for %zu values", i.size(), x.size());
    return -1;
  }
  const i_t nz = i.size();
  for (i_t k = 0; k < nz; ++k) {
    if (i[k] < 0 || i[k] >= n) {
      CUSPA_LOG_ERROR("Sparse vector error: index %lld not in range [0, %lld)",
                      static_cast<long long>(i[k]),
                      static_cast<long long>(n));
      return -1;
    }
    if (k > 0 && i[k - 1] >= i[k]) {
      CUSPA_LOG_ERROR("Sparse vector error: indices not strictly increasing at %lld",
                      static_cast<long long>(k));
      return -1;
    }
  }
  return 0;
}

#if CUSPA_INSTANTIATE_FLOAT
template class sparse_vector_t<int, float>;
template class sparse_vector_t<int64_t, float>;
#endif

#if CUSPA_INSTANTIATE_DOUBLE
template class sparse_vector_t<int, double>;
template class sparse_vector_t<int64_t, double>;
#endif

}  // namespace cuspa::host
