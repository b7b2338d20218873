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

#include <cusparse_v2.h>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

namespace cuspa {

/**
 * @brief Opaque payload of a hybrid (HYB) matrix.
 *
 * Owns a cuSPARSE generic sparse matrix descriptor together with the device memory it points
 * to. The descriptor is released with `cusparseDestroySpMat` and the memory freed when the last
 * `hyb_matrix_t` sharing the handle goes away. The layout behind the descriptor is chosen by
 * cuSPARSE and is not inspectable.
 */
class hyb_handle_t {
 public:
  /**
   * @param[in] descr Descriptor, ownership is transferred to the handle
   * @param[in] storage Keeps the buffers referenced by `descr` alive, may be empty
   */
  hyb_handle_t(cusparseSpMatDescr_t descr, std::shared_ptr<void> storage);
  ~hyb_handle_t();

  hyb_handle_t(hyb_handle_t const&)            = delete;
  hyb_handle_t& operator=(hyb_handle_t const&) = delete;

  cusparseSpMatDescr_t descriptor() const { return descr_; }

 private:
  cusparseSpMatDescr_t descr_{nullptr};
  std::shared_ptr<void> storage_;
};

/**
 * @brief A sparse matrix in hybrid format resident on a GPU.
 *
 * Only the shape, the number of stored entries and the device are known on the host, the
 * payload is managed by cuSPARSE through `hyb_handle_t`. Records produced by `copy` share the
 * payload with their source.
 */
template <typename i_t, typename f_t>
class hyb_matrix_t {
 public:
  static_assert(std::is_integral<i_t>::value,
                "'hyb_matrix_t' accepts only integer types for indexes");
  static_assert(is_supported_value_type_v<f_t>,
                "'hyb_matrix_t' accepts only float and double values");

  static constexpr int rank = 2;

  hyb_matrix_t(raft::handle_t const* handle_ptr,
               std::shared_ptr<hyb_handle_t> payload,
               i_t rows,
               i_t cols,
               i_t nnz);

  hyb_matrix_t(hyb_matrix_t&&)            = default;
  hyb_matrix_t& operator=(hyb_matrix_t&&) = default;

  shape_t<i_t> shape() const { return {m, n}; }
  int ndims() const { return rank; }
  i_t length_along(int dim) const { return cuspa::length_along(shape(), rank, dim); }
  int64_t element_count() const { return static_cast<int64_t>(m) * static_cast<int64_t>(n); }
  i_t nonzero_count() const { return nnz; }
  int device_id() const { return device; }
  cudaDataType element_type() const { return cuda_data_type<f_t>(); }
  std::string summary() const;

  // Replaces the payload after an external conversion, the shape is unchanged
  void reset(std::shared_ptr<hyb_handle_t> new_payload, i_t new_nnz);

  raft::handle_t const* handle_ptr{nullptr};
  std::shared_ptr<hyb_handle_t> payload;
  i_t m;
  i_t n;
  i_t nnz;
  int device;
};

/**
 * @brief Makes `dst` share the payload of `src`.
 *
 * No device memory is copied: both records alias one payload afterwards and a warning is logged.
 * The payload stays alive as long as either record does.
 *
 * @throws cuspa::logic_error with error_type_t::ShapeMismatch when the shapes differ, `dst` is
 * left untouched
 */
template <typename i_t, typename f_t>
hyb_matrix_t<i_t, f_t>& copy(hyb_matrix_t<i_t, f_t>& dst,
                             hyb_matrix_t<i_t, f_t> const& src,
                             rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
hyb_matrix_t<i_t, f_t>& copy(hyb_matrix_t<i_t, f_t>& dst, hyb_matrix_t<i_t, f_t> const& src);

// New record aliasing the payload of `src`
template <typename i_t, typename f_t>
hyb_matrix_t<i_t, f_t> copy(hyb_matrix_t<i_t, f_t> const& src, rmm::cuda_stream_view stream);
template <typename i_t, typename f_t>
hyb_matrix_t<i_t, f_t> copy(hyb_matrix_t<i_t, f_t> const& src);

template <typename i_t, typename f_t>
std::ostream& operator<<(std::ostream& os, hyb_matrix_t<i_t, f_t> const& A)
{
  return os << A.summary();
}

}  // namespace cuspa
