/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/host/sparse_vector.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace cuspa::host::test {

TEST(host_sparse_vector, sort_and_check)
{
  sparse_vector_t<int, double> x(6, {4, 1, 3}, {40.0, 10.0, 30.0});
  EXPECT_EQ(x.check_vector(), -1);
  x.sort();
  EXPECT_EQ(x.i, (std::vector<int>{1, 3, 4}));
  EXPECT_EQ(x.x, (std::vector<double>{10.0, 30.0, 40.0}));
  EXPECT_EQ(x.check_vector(), 0);
  EXPECT_EQ(x.nnz(), 3);
}

TEST(host_sparse_vector, to_dense)
{
  sparse_vector_t<int64_t, float> x(4, {0, 2}, {1.5f, -2.0f});
  std::vector<float> dense;
  x.to_dense(dense);
  EXPECT_EQ(dense, (std::vector<float>{1.5f, 0.0f, -2.0f, 0.0f}));
}

TEST(host_sparse_vector, to_csc_single_column)
{
  sparse_vector_t<int, double> x(5, {0, 4}, {1.0, 2.0});
  csc_matrix_t<int, double> A;
  x.to_csc(A);
  EXPECT_EQ(A.m, 5);
  EXPECT_EQ(A.n, 1);
  EXPECT_EQ(A.col_start, (std::vector<int>{0, 2}));
  EXPECT_EQ(A.i, x.i);
  EXPECT_EQ(A.x, x.x);
  EXPECT_EQ(A.check_matrix(), 0);
}

TEST(host_sparse_vector, check_rejects_out_of_range)
{
  sparse_vector_t<int, double> x(2, {2}, {1.0});
  EXPECT_EQ(x.check_vector(), -1);

  sparse_vector_t<int, double> y(2, {0, 1}, {1.0});
  EXPECT_EQ(y.check_vector(), -1);
}

}  // namespace cuspa::host::test
