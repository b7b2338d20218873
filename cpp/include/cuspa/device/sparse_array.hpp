/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/error.hpp>

#include <cusparse_v2.h>

#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace cuspa {

/** (rows, columns) of a device sparse container; vectors are (n, 1) */
template <typename i_t>
using shape_t = std::pair<i_t, i_t>;

template <typename i_t, typename f_t>
class sparse_vector_t;
template <typename i_t, typename f_t>
class csc_matrix_t;
template <typename i_t, typename f_t>
class csr_matrix_t;
template <typename i_t, typename f_t>
class bsr_matrix_t;
template <typename i_t, typename f_t>
class hyb_matrix_t;

/**
 * @brief Scalar kinds a device sparse container may hold
 */
template <typename f_t>
inline constexpr bool is_supported_value_type_v =
  std::is_same_v<f_t, float> || std::is_same_v<f_t, double>;

/**
 * @brief True for the formats whose nonzero pattern is directly addressable (CSC and CSR). Only
 * these can be decorated by symmetric and hermitian views.
 */
template <typename T>
struct is_compressed_sparse : std::false_type {};
template <typename i_t, typename f_t>
struct is_compressed_sparse<csc_matrix_t<i_t, f_t>> : std::true_type {};
template <typename i_t, typename f_t>
struct is_compressed_sparse<csr_matrix_t<i_t, f_t>> : std::true_type {};
template <typename T>
inline constexpr bool is_compressed_sparse_v = is_compressed_sparse<T>::value;

template <typename T>
struct is_device_sparse_matrix : is_compressed_sparse<T> {};
template <typename i_t, typename f_t>
struct is_device_sparse_matrix<bsr_matrix_t<i_t, f_t>> : std::true_type {};
template <typename i_t, typename f_t>
struct is_device_sparse_matrix<hyb_matrix_t<i_t, f_t>> : std::true_type {};
template <typename T>
inline constexpr bool is_device_sparse_matrix_v = is_device_sparse_matrix<T>::value;

template <typename f_t>
constexpr cudaDataType cuda_data_type()
{
  static_assert(is_supported_value_type_v<f_t>, "unsupported sparse value type");
  if constexpr (std::is_same_v<f_t, float>) {
    return CUDA_R_32F;
  } else {
    return CUDA_R_64F;
  }
}

template <typename i_t>
constexpr cusparseIndexType_t cusparse_index_type()
{
  static_assert(std::is_same_v<i_t, int32_t> || std::is_same_v<i_t, int64_t>,
                "cuSPARSE supports 32 and 64 bit indices only");
  if constexpr (std::is_same_v<i_t, int32_t>) {
    return CUSPARSE_INDEX_32I;
  } else {
    return CUSPARSE_INDEX_64I;
  }
}

template <typename f_t>
inline std::string value_type_name()
{
  if constexpr (std::is_same_v<f_t, float>) {
    return "float";
  } else {
    return "double";
  }
}

/**
 * @brief Extent of `dims` along dimension `dim` (1-based) of a container of rank `rank`.
 *
 * Dimensions beyond the rank have extent 1.
 *
 * @throws cuspa::logic_error with error_type_t::InvalidDimension when dim < 1
 */
template <typename i_t>
i_t length_along(shape_t<i_t> const& dims, int rank, int dim)
{
  cuspa_expects(dim >= 1, error_type_t::InvalidDimension, "dimension must be >= 1, got %d", dim);
  if (dim > rank) { return 1; }
  return dim == 1 ? dims.first : dims.second;
}

namespace detail {

// First `count` entries of `v`; host structures may carry capacity beyond their stored entries
template <typename T>
std::vector<T> leading(std::vector<T> const& v, size_t count)
{
  cuspa_expects(count <= v.size(),
                error_type_t::ValidationError,
                "%zu stored entries requested from a buffer of %zu",
                count,
                v.size());
  return std::vector<T>(v.begin(), v.begin() + count);
}

// Buffer sizes of a compressed format with `outer` slices holding `nnz` entries
inline void expect_compressed_sizes(const char* format,
                                    size_t pointers,
                                    int64_t outer,
                                    size_t indices,
                                    size_t values,
                                    int64_t nnz)
{
  cuspa_expects(pointers == static_cast<size_t>(outer) + 1,
                error_type_t::ValidationError,
                "%s matrix needs %lld pointers, got %zu",
                format,
                static_cast<long long>(outer) + 1,
                pointers);
  cuspa_expects(nnz >= 0 && indices >= static_cast<size_t>(nnz) &&
                  values >= static_cast<size_t>(nnz),
                error_type_t::ValidationError,
                "%s matrix with %lld entries has %zu indices and %zu values",
                format,
                static_cast<long long>(nnz),
                indices,
                values);
}

}  // namespace detail

/**
 * @brief Converts host structural indices to the device index type
 *
 * @throws cuspa::logic_error with error_type_t::ValidationError when an index does not fit i_t
 */
template <typename i_t, typename host_i_t>
std::vector<i_t> narrow_indices(std::vector<host_i_t> const& indices)
{
  static_assert(std::is_integral_v<host_i_t>, "structural indices must be integers");
  if constexpr (std::is_same_v<i_t, host_i_t>) {
    return indices;
  } else {
    std::vector<i_t> out(indices.size());
    for (size_t k = 0; k < indices.size(); ++k) {
      const auto v = indices[k];
      cuspa_expects(static_cast<int64_t>(v) >= static_cast<int64_t>(std::numeric_limits<i_t>::min()) &&
                      static_cast<int64_t>(v) <= static_cast<int64_t>(std::numeric_limits<i_t>::max()),
                    error_type_t::ValidationError,
                    "structural index %lld does not fit the device index type",
                    static_cast<long long>(v));
      out[k] = static_cast<i_t>(v);
    }
    return out;
  }
}

/**
 * @brief Converts a host extent (number of rows, columns or vector length) to the device index
 * type
 *
 * @throws cuspa::logic_error with error_type_t::ValidationError when `extent` is negative or does
 * not fit i_t
 */
template <typename i_t, typename host_i_t>
i_t narrow_extent(host_i_t extent, const char* what)
{
  static_assert(std::is_integral_v<host_i_t>, "extents must be integers");
  cuspa_expects(extent >= 0 && static_cast<int64_t>(extent) <=
                                 static_cast<int64_t>(std::numeric_limits<i_t>::max()),
                error_type_t::ValidationError,
                "%s %lld does not fit the device index type",
                what,
                static_cast<long long>(extent));
  return static_cast<i_t>(extent);
}

}  // namespace cuspa
