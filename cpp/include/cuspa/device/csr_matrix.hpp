/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/device/csc_matrix.hpp>
#include <cuspa/device/sparse_array.hpp>
#include <cuspa/host/sparse_matrix.hpp>

#include <raft/core/handle.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_uvector.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cuspa {

// Defined in conversions.hpp
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t> to_csr(csc_matrix_t<i_t, f_t> const& A);

/**
 * @brief A sparse matrix in compressed sparse row (CSR) format resident on a GPU.
 *
 * For more information about CSR checkout:
 * https://docs.nvidia.com/cuda/cusparse/index.html#compressed-sparse-row-csr
 *
 * @tparam i_t Integer type of the row pointers and column indices
 * @tparam f_t Data type of the stored values
 */
template <typename i_t, typename f_t>
class csr_matrix_t {
 public:
  static_assert(std::is_integral<i_t>::value,
                "'csr_matrix_t' accepts only integer types for indexes");
  static_assert(is_supported_value_type_v<f_t>,
                "'csr_matrix_t' accepts only float and double values");

  static constexpr int rank = 2;

  /**
   * @brief Allocates uninitialized storage for a `rows` x `cols` matrix with `nnz` entries
   */
  csr_matrix_t(raft::handle_t const* handle_ptr, i_t rows, i_t cols, i_t nnz);

  /**
   * @brief Takes ownership of device buffers, typically produced by a cuSPARSE call
   *
   * @param[in] nnz Number of stored entries. Defaults to the size of `values`.
   * @throws cuspa::logic_error when the buffer sizes are inconsistent with the shape
   */
  csr_matrix_t(raft::handle_t const* handle_ptr,
               rmm::device_uvector<i_t>&& row_start,
               rmm::device_uvector<i_t>&& col_indices,
               rmm::device_uvector<f_t>&& values,
               i_t rows,
               i_t cols,
               i_t nnz = -1);

  /**
   * @brief Uploads host CSR arrays on the stream of the handle
   *
   * @throws cuspa::logic_error when the array sizes are inconsistent with the shape
   */
  csr_matrix_t(raft::handle_t const* handle_ptr,
               std::vector<i_t> const& row_start,
               std::vector<i_t> const& col_indices,
               std::vector<f_t> const& values,
               i_t rows,
               i_t cols);

  template <typename host_i_t>
  csr_matrix_t(raft::handle_t const* handle_ptr, host::csr_matrix_t<host_i_t, f_t> const& A)
    : csr_matrix_t(handle_ptr,
                   narrow_indices<i_t>(A.row_start),
                   narrow_indices<i_t>(detail::leading(A.j, A.nnz())),
                   detail::leading(A.x, A.nnz()),
                   narrow_extent<i_t>(A.m, "row count"),
                   narrow_extent<i_t>(A.n, "column count"))
  {
  }

  /**
   * @brief Uploads a host CSC matrix and converts it to CSR with cuSPARSE on the handle stream,
   * the stream is synchronized before returning
   */
  template <typename host_i_t>
  csr_matrix_t(raft::handle_t const* handle_ptr, host::csc_matrix_t<host_i_t, f_t> const& A)
    : csr_matrix_t(to_csr(csc_matrix_t<i_t, f_t>(handle_ptr, A)))
  {
    handle_ptr->sync_stream();
  }

  csr_matrix_t(csr_matrix_t&&)            = default;
  csr_matrix_t& operator=(csr_matrix_t&&) = default;

  shape_t<i_t> shape() const { return {m, n}; }
  int ndims() const { return rank; }
  i_t length_along(int dim) const { return cuspa::length_along(shape(), rank, dim); }
  int64_t element_count() const { return static_cast<int64_t>(m) * static_cast<int64_t>(n); }
  i_t nonzero_count() const { return nnz; }
  int device_id() const { return device; }
  cudaDataType element_type() const { return cuda_data_type<f_t>(); }
  bool is_symmetric() const { return false; }
  bool is_hermitian() const { return false; }
  std::string summary() const;

  /**
   * @brief Downloads the matrix as a host CSC matrix; `stream` is synchronized before returning
   *
   * The row pointers are expanded into one explicit row index per entry and the resulting
   * (row, column, value) triplets are assembled column by column.
   */
  host::csc_matrix_t<i_t, f_t> to_host(rmm::cuda_stream_view stream) const;
  host::csc_matrix_t<i_t, f_t> to_host() const;

  // Downloads the three CSR buffers as they are
  host::csr_matrix_t<i_t, f_t> to_host_csr(rmm::cuda_stream_view stream) const;
  host::csr_matrix_t<i_t, f_t> to_host_csr() const;

  /**
   * @brief A matrix with the same shape and a deep copy of the sparsity pattern, values are left
   * uninitialized
   */
  csr_matrix_t similar(rmm::cuda_stream_view stream) const;
  csr_matrix_t similar() const;

  raft::handle_t const* handle_ptr{nullptr};
  rmm::device_uvector<i_t> row_start;    // row pointers (size m + 1)
  rmm::device_uvector<i_t> col_indices;  // column indices, size nnz
  rmm::device_uvector<f_t> values;       // numerical values, size nnz
  i_t m;                                 // number of rows
  i_t n;                                 // number of columns
  i_t nnz;                               // number of stored entries
  int device;
};

/**
 * @brief Overwrites the buffers of `dst` with those of `src` on `stream`
 *
 * The overload without `stream` runs on the stream of `dst` after the stream of `src` is drained
 * and blocks until the copy is complete. With `stream` the copy is only enqueued.
 *
 * @throws cuspa::logic_error with error_type_t::ShapeMismatch when the shapes differ, `dst` is
 * left untouched
 */
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t>& copy(csr_matrix_t<i_t, f_t>& dst,
                             csr_matrix_t<i_t, f_t> const& src,
                             rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t>& copy(csr_matrix_t<i_t, f_t>& dst, csr_matrix_t<i_t, f_t> const& src);

// Independent deep copy of `src`, blocking unless `stream` is given
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t> copy(csr_matrix_t<i_t, f_t> const& src, rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
csr_matrix_t<i_t, f_t> copy(csr_matrix_t<i_t, f_t> const& src);

template <typename i_t, typename f_t>
std::ostream& operator<<(std::ostream& os, csr_matrix_t<i_t, f_t> const& A)
{
  return os << A.summary();
}

}  // namespace cuspa
