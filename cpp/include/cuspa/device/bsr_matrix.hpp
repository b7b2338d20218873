/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/device/sparse_array.hpp>

#include <raft/core/handle.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_uvector.hpp>

#include <cusparse_v2.h>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cuspa {

/**
 * @brief A sparse matrix in block compressed sparse row (BSR) format resident on a GPU.
 *
 * BSR is a CSR layout over block rows whose stored units are dense square blocks of side
 * `block_dim`, suited to matrices made of rare dense regions. Each block is stored row major or
 * column major according to `direction`.
 *
 * For more information about BSR checkout:
 * https://docs.nvidia.com/cuda/cusparse/index.html#block-compressed-sparse-row-bsr
 *
 * @tparam i_t Integer type of the block row pointers and block column indices
 * @tparam f_t Data type of the stored values
 */
template <typename i_t, typename f_t>
class bsr_matrix_t {
 public:
  static_assert(std::is_integral<i_t>::value,
                "'bsr_matrix_t' accepts only integer types for indexes");
  static_assert(is_supported_value_type_v<f_t>,
                "'bsr_matrix_t' accepts only float and double values");

  static constexpr int rank = 2;

  /**
   * @brief Allocates uninitialized storage for `nnz_blocks` blocks of a `rows` x `cols` matrix
   */
  bsr_matrix_t(raft::handle_t const* handle_ptr,
               i_t rows,
               i_t cols,
               i_t block_dim,
               i_t nnz_blocks,
               cusparseDirection_t direction = CUSPARSE_DIRECTION_ROW);

  /**
   * @brief Takes ownership of device buffers, typically produced by a cuSPARSE call
   *
   * @param[in] nnz_blocks Number of stored blocks. Defaults to the size of `col_indices`.
   * @throws cuspa::logic_error when the buffer sizes are inconsistent with the shape and block size
   */
  bsr_matrix_t(raft::handle_t const* handle_ptr,
               rmm::device_uvector<i_t>&& row_start,
               rmm::device_uvector<i_t>&& col_indices,
               rmm::device_uvector<f_t>&& values,
               i_t rows,
               i_t cols,
               i_t block_dim,
               cusparseDirection_t direction,
               i_t nnz_blocks = -1);

  /**
   * @brief Uploads host BSR arrays on the stream of the handle
   *
   * @throws cuspa::logic_error when the array sizes are inconsistent with the shape and block size
   */
  bsr_matrix_t(raft::handle_t const* handle_ptr,
               std::vector<i_t> const& row_start,
               std::vector<i_t> const& col_indices,
               std::vector<f_t> const& values,
               i_t rows,
               i_t cols,
               i_t block_dim,
               cusparseDirection_t direction = CUSPARSE_DIRECTION_ROW);

  bsr_matrix_t(bsr_matrix_t&&)            = default;
  bsr_matrix_t& operator=(bsr_matrix_t&&) = default;

  shape_t<i_t> shape() const { return {m, n}; }
  int ndims() const { return rank; }
  i_t length_along(int dim) const { return cuspa::length_along(shape(), rank, dim); }
  int64_t element_count() const { return static_cast<int64_t>(m) * static_cast<int64_t>(n); }
  // Number of stored blocks
  i_t nonzero_count() const { return nnz; }
  int device_id() const { return device; }
  cudaDataType element_type() const { return cuda_data_type<f_t>(); }
  i_t block_rows() const { return (m + block_dim - 1) / block_dim; }
  i_t block_cols() const { return (n + block_dim - 1) / block_dim; }
  std::string summary() const;

  /**
   * @brief A matrix with the same shape, block size and direction and a deep copy of the block
   * pattern, values are left uninitialized
   */
  bsr_matrix_t similar(rmm::cuda_stream_view stream) const;
  bsr_matrix_t similar() const;

  raft::handle_t const* handle_ptr{nullptr};
  rmm::device_uvector<i_t> row_start;    // block row pointers (size block_rows() + 1)
  rmm::device_uvector<i_t> col_indices;  // block column indices, size nnz
  rmm::device_uvector<f_t> values;       // block values, size nnz * block_dim * block_dim
  i_t m;                                 // number of rows
  i_t n;                                 // number of columns
  i_t block_dim;
  cusparseDirection_t direction;
  i_t nnz;  // number of stored blocks
  int device;
};

/**
 * @brief Overwrites the buffers of `dst` with those of `src` on `stream`, together with the block
 * size and storage direction
 *
 * The overload without `stream` runs on the stream of `dst` after the stream of `src` is drained
 * and blocks until the copy is complete. With `stream` the copy is only enqueued.
 *
 * @throws cuspa::logic_error with error_type_t::ShapeMismatch when the shapes differ, `dst` is
 * left untouched
 */
template <typename i_t, typename f_t>
bsr_matrix_t<i_t, f_t>& copy(bsr_matrix_t<i_t, f_t>& dst,
                             bsr_matrix_t<i_t, f_t> const& src,
                             rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
bsr_matrix_t<i_t, f_t>& copy(bsr_matrix_t<i_t, f_t>& dst, bsr_matrix_t<i_t, f_t> const& src);

// Independent deep copy of `src`, blocking unless `stream` is given
template <typename i_t, typename f_t>
bsr_matrix_t<i_t, f_t> copy(bsr_matrix_t<i_t, f_t> const& src, rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
bsr_matrix_t<i_t, f_t> copy(bsr_matrix_t<i_t, f_t> const& src);

template <typename i_t, typename f_t>
std::ostream& operator<<(std::ostream& os, bsr_matrix_t<i_t, f_t> const& A)
{
  return os << A.summary();
}

}  // namespace cuspa
