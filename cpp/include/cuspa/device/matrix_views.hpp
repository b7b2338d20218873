/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/device/bsr_matrix.hpp>
#include <cuspa/device/csc_matrix.hpp>
#include <cuspa/device/csr_matrix.hpp>
#include <cuspa/device/hyb_matrix.hpp>
#include <cuspa/device/sparse_array.hpp>

#include <cusparse_v2.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace cuspa {

namespace detail {

inline const char* fill_mode_name(cusparseFillMode_t fill_mode)
{
  return fill_mode == CUSPARSE_FILL_MODE_UPPER ? "upper" : "lower";
}

/**
 * @brief Non-owning reference to a device matrix together with the triangle that holds its
 * significant entries. Shape queries forward to the viewed matrix, which must outlive the view.
 */
template <typename matrix_t>
class matrix_view_base_t {
 public:
  using shape_type = decltype(std::declval<matrix_t const&>().shape());
  using index_type = typename shape_type::first_type;

  matrix_view_base_t(matrix_t const& A, cusparseFillMode_t fill_mode)
    : parent_(A), fill_mode_(fill_mode)
  {
  }

  matrix_t const& parent() const { return parent_; }
  cusparseFillMode_t fill_mode() const { return fill_mode_; }

  shape_type shape() const { return parent_.shape(); }
  int ndims() const { return parent_.ndims(); }
  index_type length_along(int dim) const { return parent_.length_along(dim); }
  int64_t element_count() const { return parent_.element_count(); }
  index_type nonzero_count() const { return parent_.nonzero_count(); }
  int device_id() const { return parent_.device_id(); }
  cudaDataType element_type() const { return parent_.element_type(); }

 protected:
  std::string describe(const char* kind) const
  {
    return std::string(kind) + " view (" + fill_mode_name(fill_mode_) + ") of " +
           parent_.summary();
  }

 private:
  matrix_t const& parent_;
  cusparseFillMode_t fill_mode_;
};

}  // namespace detail

/**
 * @brief Marks a CSC or CSR matrix as symmetric. Only the triangle named by `fill_mode()` is
 * meant to be read, the buffers are not duplicated.
 */
template <typename matrix_t>
class symmetric_view_t : public detail::matrix_view_base_t<matrix_t> {
 public:
  static_assert(is_compressed_sparse_v<matrix_t>,
                "'symmetric_view_t' decorates csc_matrix_t and csr_matrix_t only");

  explicit symmetric_view_t(matrix_t const& A,
                            cusparseFillMode_t fill_mode = CUSPARSE_FILL_MODE_UPPER)
    : detail::matrix_view_base_t<matrix_t>(A, fill_mode)
  {
  }

  bool is_symmetric() const { return true; }
  // Every supported value type is real
  bool is_hermitian() const { return true; }
  std::string summary() const { return this->describe("symmetric"); }
};

/**
 * @brief Marks a CSC or CSR matrix as hermitian. For the real value types supported here this is
 * the same as symmetric.
 */
template <typename matrix_t>
class hermitian_view_t : public detail::matrix_view_base_t<matrix_t> {
 public:
  static_assert(is_compressed_sparse_v<matrix_t>,
                "'hermitian_view_t' decorates csc_matrix_t and csr_matrix_t only");

  explicit hermitian_view_t(matrix_t const& A,
                            cusparseFillMode_t fill_mode = CUSPARSE_FILL_MODE_UPPER)
    : detail::matrix_view_base_t<matrix_t>(A, fill_mode)
  {
  }

  bool is_symmetric() const { return true; }
  bool is_hermitian() const { return true; }
  std::string summary() const { return this->describe("hermitian"); }
};

// Marks any device sparse matrix as upper or lower triangular
template <typename matrix_t>
class triangular_view_t : public detail::matrix_view_base_t<matrix_t> {
 public:
  static_assert(is_device_sparse_matrix_v<matrix_t>,
                "'triangular_view_t' decorates device sparse matrices only");

  triangular_view_t(matrix_t const& A, cusparseFillMode_t fill_mode)
    : detail::matrix_view_base_t<matrix_t>(A, fill_mode)
  {
  }

  bool is_upper() const { return this->fill_mode() == CUSPARSE_FILL_MODE_UPPER; }
  bool is_lower() const { return this->fill_mode() == CUSPARSE_FILL_MODE_LOWER; }
  std::string summary() const { return this->describe("triangular"); }
};

template <typename matrix_t>
symmetric_view_t<matrix_t> symmetric(matrix_t const& A,
                                     cusparseFillMode_t fill_mode = CUSPARSE_FILL_MODE_UPPER)
{
  return symmetric_view_t<matrix_t>(A, fill_mode);
}

template <typename matrix_t>
hermitian_view_t<matrix_t> hermitian(matrix_t const& A,
                                     cusparseFillMode_t fill_mode = CUSPARSE_FILL_MODE_UPPER)
{
  return hermitian_view_t<matrix_t>(A, fill_mode);
}

template <typename matrix_t>
triangular_view_t<matrix_t> upper_triangular(matrix_t const& A)
{
  return triangular_view_t<matrix_t>(A, CUSPARSE_FILL_MODE_UPPER);
}

template <typename matrix_t>
triangular_view_t<matrix_t> lower_triangular(matrix_t const& A)
{
  return triangular_view_t<matrix_t>(A, CUSPARSE_FILL_MODE_LOWER);
}

// Temporaries would leave the view dangling
template <typename matrix_t>
void symmetric(matrix_t const&&, cusparseFillMode_t = CUSPARSE_FILL_MODE_UPPER) = delete;
template <typename matrix_t>
void hermitian(matrix_t const&&, cusparseFillMode_t = CUSPARSE_FILL_MODE_UPPER) = delete;
template <typename matrix_t>
void upper_triangular(matrix_t const&&) = delete;
template <typename matrix_t>
void lower_triangular(matrix_t const&&) = delete;

template <typename matrix_t>
std::ostream& operator<<(std::ostream& os, symmetric_view_t<matrix_t> const& V)
{
  return os << V.summary();
}

template <typename matrix_t>
std::ostream& operator<<(std::ostream& os, hermitian_view_t<matrix_t> const& V)
{
  return os << V.summary();
}

template <typename matrix_t>
std::ostream& operator<<(std::ostream& os, triangular_view_t<matrix_t> const& V)
{
  return os << V.summary();
}

}  // namespace cuspa
