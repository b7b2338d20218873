/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/device/sparse_array.hpp>
#include <cuspa/host/sparse_matrix.hpp>
#include <cuspa/host/sparse_vector.hpp>

#include <raft/core/handle.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_uvector.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace cuspa {

namespace detail {

// The entries of the only column of A, as a host sparse vector of length A.m
template <typename i_t, typename f_t>
host::sparse_vector_t<i_t, f_t> single_column(host::csc_matrix_t<i_t, f_t> const& A)
{
  cuspa_expects(A.n == 1,
                error_type_t::UnsupportedConversion,
                "cannot convert a matrix with %lld columns into a sparse vector",
                static_cast<long long>(A.n));
  const auto nz = A.nnz();
  return host::sparse_vector_t<i_t, f_t>(A.m,
                                         std::vector<i_t>(A.i.begin(), A.i.begin() + nz),
                                         std::vector<f_t>(A.x.begin(), A.x.begin() + nz));
}

}  // namespace detail

/**
 * @brief A sparse vector resident on a GPU, the device counterpart of `host::sparse_vector_t`.
 *
 * Entries are kept as a pair of device buffers of equal size `nnz`: strictly increasing positions
 * in `[0, n)` and their values. The container owns both buffers.
 *
 * @tparam i_t Integer type of the stored positions
 * @tparam f_t Data type of the stored values
 */
template <typename i_t, typename f_t>
class sparse_vector_t {
 public:
  static_assert(std::is_integral<i_t>::value,
                "'sparse_vector_t' accepts only integer types for indexes");
  static_assert(is_supported_value_type_v<f_t>,
                "'sparse_vector_t' accepts only float and double values");

  static constexpr int rank = 1;

  /**
   * @brief Allocates uninitialized storage for `nnz` entries of a vector of length `n`
   */
  sparse_vector_t(raft::handle_t const* handle_ptr, i_t n, i_t nnz);

  /**
   * @brief Takes ownership of device buffers, `nnz` is the size of `values`
   *
   * @throws cuspa::logic_error when the buffers differ in size
   */
  sparse_vector_t(raft::handle_t const* handle_ptr,
                  rmm::device_uvector<i_t>&& indices,
                  rmm::device_uvector<f_t>&& values,
                  i_t n);

  /**
   * @brief Uploads host positions and values on the stream of the handle
   *
   * @throws cuspa::logic_error when the arrays differ in size
   */
  sparse_vector_t(raft::handle_t const* handle_ptr,
                  std::vector<i_t> const& indices,
                  std::vector<f_t> const& values,
                  i_t n);

  template <typename host_i_t>
  sparse_vector_t(raft::handle_t const* handle_ptr, host::sparse_vector_t<host_i_t, f_t> const& x)
    : sparse_vector_t(
        handle_ptr, narrow_indices<i_t>(x.i), x.x, narrow_extent<i_t>(x.n, "vector length"))
  {
  }

  /**
   * @brief Uploads the only column of a host CSC matrix
   *
   * @throws cuspa::logic_error with error_type_t::UnsupportedConversion when `A` does not have
   * exactly one column
   */
  template <typename host_i_t>
  sparse_vector_t(raft::handle_t const* handle_ptr, host::csc_matrix_t<host_i_t, f_t> const& A)
    : sparse_vector_t(handle_ptr, detail::single_column(A))
  {
  }

  sparse_vector_t(sparse_vector_t&&)            = default;
  sparse_vector_t& operator=(sparse_vector_t&&) = default;

  shape_t<i_t> shape() const { return {n, 1}; }
  int ndims() const { return rank; }
  i_t length_along(int dim) const { return cuspa::length_along(shape(), rank, dim); }
  int64_t element_count() const { return static_cast<int64_t>(n); }
  i_t nonzero_count() const { return nnz; }
  int device_id() const { return device; }
  cudaDataType element_type() const { return cuda_data_type<f_t>(); }
  std::string summary() const;

  /**
   * @brief Downloads the vector; `stream` is synchronized before returning
   */
  host::sparse_vector_t<i_t, f_t> to_host(rmm::cuda_stream_view stream) const;
  host::sparse_vector_t<i_t, f_t> to_host() const;

  /**
   * @brief A vector with the same length and a deep copy of the positions, values are left
   * uninitialized
   */
  sparse_vector_t similar(rmm::cuda_stream_view stream) const;
  sparse_vector_t similar() const;

  raft::handle_t const* handle_ptr{nullptr};
  rmm::device_uvector<i_t> indices;
  rmm::device_uvector<f_t> values;
  i_t n;
  i_t nnz;
  int device;
};

/**
 * @brief Overwrites the buffers of `dst` with those of `src` on `stream`
 *
 * The overload without `stream` runs on the stream of `dst` after the stream of `src` is drained
 * and blocks until the copy is complete. With `stream` the copy is only enqueued.
 *
 * @throws cuspa::logic_error with error_type_t::ShapeMismatch when the lengths differ, `dst` is
 * left untouched
 */
template <typename i_t, typename f_t>
sparse_vector_t<i_t, f_t>& copy(sparse_vector_t<i_t, f_t>& dst,
                                sparse_vector_t<i_t, f_t> const& src,
                                rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
sparse_vector_t<i_t, f_t>& copy(sparse_vector_t<i_t, f_t>& dst,
                                sparse_vector_t<i_t, f_t> const& src);

// Independent deep copy of `src`, blocking unless `stream` is given
template <typename i_t, typename f_t>
sparse_vector_t<i_t, f_t> copy(sparse_vector_t<i_t, f_t> const& src,
                               rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
sparse_vector_t<i_t, f_t> copy(sparse_vector_t<i_t, f_t> const& src);

template <typename i_t, typename f_t>
std::ostream& operator<<(std::ostream& os, sparse_vector_t<i_t, f_t> const& x)
{
  return os << x.summary();
}

}  // namespace cuspa
