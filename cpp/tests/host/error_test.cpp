/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/device/sparse_array.hpp>
#include <cuspa/error.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

namespace cuspa::test {

TEST(error, expects_carries_type_and_message)
{
  try {
    cuspa_expects(false, error_type_t::ShapeMismatch, "sizes %d and %d", 2, 3);
    FAIL() << "cuspa_expects did not throw";
  } catch (cuspa::logic_error const& e) {
    EXPECT_EQ(e.get_error_type(), error_type_t::ShapeMismatch);
    EXPECT_EQ(std::string(e.what()),
              "{\"CUSPA_ERROR_TYPE\": \"ShapeMismatch\", \"msg\": \"sizes 2 and 3\"}");
  }
  EXPECT_NO_THROW(cuspa_expects(true, error_type_t::ShapeMismatch, "unused"));
}

TEST(error, fail_is_runtime_error)
{
  try {
    CUSPA_FAIL("broken %s", "invariant");
    FAIL() << "CUSPA_FAIL did not throw";
  } catch (cuspa::logic_error const& e) {
    EXPECT_EQ(e.get_error_type(), error_type_t::RuntimeError);
    EXPECT_EQ(std::string(e.what()), "cuspa failure - broken invariant");
  }
}

TEST(length_along, within_and_beyond_rank)
{
  shape_t<int> matrix{3, 4};
  EXPECT_EQ(length_along(matrix, 2, 1), 3);
  EXPECT_EQ(length_along(matrix, 2, 2), 4);
  EXPECT_EQ(length_along(matrix, 2, 3), 1);
  EXPECT_EQ(length_along(matrix, 2, 100), 1);

  shape_t<int> vector{7, 1};
  EXPECT_EQ(length_along(vector, 1, 1), 7);
  EXPECT_EQ(length_along(vector, 1, 2), 1);
}

TEST(length_along, rejects_non_positive_dimension)
{
  shape_t<int> matrix{3, 4};
  for (int dim : {0, -1}) {
    try {
      length_along(matrix, 2, dim);
      FAIL() << "dimension " << dim << " accepted";
    } catch (cuspa::logic_error const& e) {
      EXPECT_EQ(e.get_error_type(), error_type_t::InvalidDimension);
    }
  }
}

TEST(narrow_indices, rejects_overflow)
{
  EXPECT_EQ(narrow_indices<int>(std::vector<int64_t>{0, 5, 9}), (std::vector<int>{0, 5, 9}));
  try {
    narrow_indices<int>(std::vector<int64_t>{0, int64_t{1} << 40});
    FAIL() << "overflowing index accepted";
  } catch (cuspa::logic_error const& e) {
    EXPECT_EQ(e.get_error_type(), error_type_t::ValidationError);
  }
}

TEST(narrow_extent, rejects_extents_beyond_index_type)
{
  EXPECT_EQ(narrow_extent<int>(int64_t{42}, "row count"), 42);
  for (int64_t extent : {(int64_t{1} << 32) + 3, int64_t{-1}}) {
    try {
      narrow_extent<int>(extent, "row count");
      FAIL() << "extent " << extent << " accepted";
    } catch (cuspa::logic_error const& e) {
      EXPECT_EQ(e.get_error_type(), error_type_t::ValidationError);
    }
  }
}

}  // namespace cuspa::test
