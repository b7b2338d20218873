/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/constants.h>
#include <cuspa/host/sparse_matrix.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace cuspa::host::test {

TEST(host_sparse_matrix, coo_to_csc_sorts_by_column)
{
  // [5 6]
  // [0 7]
  std::vector<int> Ai{0, 0, 1};
  std::vector<int> Aj{0, 1, 1};
  std::vector<double> Ax{5.0, 6.0, 7.0};

  csc_matrix_t<int, double> A(2, 2, 1);
  ASSERT_EQ(coo_to_csc(Ai, Aj, Ax, A), 0);

  EXPECT_EQ(A.col_start, (std::vector<int>{0, 1, 3}));
  EXPECT_EQ(A.i, (std::vector<int>{0, 0, 1}));
  EXPECT_EQ(A.x, (std::vector<double>{5.0, 6.0, 7.0}));
  EXPECT_EQ(A.nz_max, 3);
  EXPECT_EQ(A.nnz(), 3);
  EXPECT_EQ(A.check_matrix(), 0);
}

TEST(host_sparse_matrix, coo_to_csc_rejects_bad_triplets)
{
  csc_matrix_t<int, double> A(2, 2, 0);
  EXPECT_EQ((coo_to_csc<int, double>({0, 1}, {0}, {1.0, 2.0}, A)), -1);
  EXPECT_EQ((coo_to_csc<int, double>({0}, {2}, {1.0}, A)), -1);
}

TEST(host_sparse_matrix, expand_row_pointers)
{
  EXPECT_EQ(expand_row_pointers(std::vector<int>{0, 2, 3}), (std::vector<int>{0, 0, 1}));
  EXPECT_EQ(expand_row_pointers(std::vector<int64_t>{0, 0, 1, 1, 4}),
            (std::vector<int64_t>{1, 3, 3, 3}));
  EXPECT_TRUE(expand_row_pointers(std::vector<int>{0}).empty());
  EXPECT_TRUE(expand_row_pointers(std::vector<int>{}).empty());
  // Decreasing pointers describe no entries
  EXPECT_TRUE(expand_row_pointers(std::vector<int>{3, 1}).empty());
}

TEST(host_sparse_matrix, cumulative_sum)
{
  std::vector<int> counts{2, 0, 3};
  std::vector<int> pointers(4);
  cumulative_sum(counts, pointers);
  EXPECT_EQ(pointers, (std::vector<int>{0, 2, 2, 5}));
  EXPECT_EQ(counts, (std::vector<int>{0, 2, 2}));
}

TEST(host_sparse_matrix, compressed_row_round_trip)
{
  // [1 0 2]
  // [0 3 0]
  csc_matrix_t<int, float> A(2, 3, {0, 1, 2, 3}, {0, 1, 0}, {1.0f, 3.0f, 2.0f});
  csr_matrix_t<int, float> Arow;
  ASSERT_EQ(A.to_compressed_row(Arow), 0);
  EXPECT_EQ(Arow.row_start, (std::vector<int>{0, 2, 3}));
  EXPECT_EQ(Arow.j, (std::vector<int>{0, 2, 1}));
  EXPECT_EQ(Arow.x, (std::vector<float>{1.0f, 2.0f, 3.0f}));
  EXPECT_EQ(Arow.check_matrix(), 0);

  csc_matrix_t<int, float> B;
  ASSERT_EQ(Arow.to_compressed_col(B), 0);
  EXPECT_EQ(B.col_start, A.col_start);
  EXPECT_EQ(B.i, A.i);
  EXPECT_EQ(B.x, A.x);
}

TEST(host_sparse_matrix, check_matrix_rejects_non_monotone_pointers)
{
  csc_matrix_t<int, double> A(3, 2, {0, 2, 1}, {0, 1}, {1.0, 2.0});
  EXPECT_EQ(A.check_matrix(), -1);

  // First slice runs past the stored entries while the last pointer still fits
  csc_matrix_t<int, double> B(3, 2, {0, 5, 2}, {0, 1}, {1.0, 2.0});
  EXPECT_EQ(B.check_matrix(), -1);

  csr_matrix_t<int, double> C(2, 3, {0, 4, 1}, {0}, {1.0});
  EXPECT_EQ(C.check_matrix(), -1);
}

TEST(host_sparse_matrix, check_matrix_rejects_repeated_indices)
{
  csc_matrix_t<int, double> A(3, 1, {0, 2}, {1, 1}, {1.0, 2.0});
  EXPECT_EQ(A.check_matrix(), -1);

  csr_matrix_t<int, double> B(1, 3, {0, 2}, {2, 2}, {1.0, 2.0});
  EXPECT_EQ(B.check_matrix(), -1);
}

TEST(host_sparse_matrix, check_matrix_rejects_out_of_range_indices)
{
  csc_matrix_t<int64_t, double> A(2, 1, {0, 1}, {2}, {1.0});
  EXPECT_EQ(A.check_matrix(), -1);
}

TEST(host_sparse_matrix, print_matrix)
{
  // [1 0 2]
  // [0 3 0]
  csc_matrix_t<int, double> A(2, 3, {0, 1, 2, 3}, {0, 1, 0}, {1.0, 3.0, 2.0});
  FILE* fid = std::tmpfile();
  ASSERT_NE(fid, nullptr);
  A.print_matrix(fid);
  std::rewind(fid);
  std::string text;
  char buffer[256];
  while (std::fgets(buffer, sizeof(buffer), fid) != nullptr) {
    text += buffer;
  }
  std::fclose(fid);
  EXPECT_EQ(text,
            "ijx = [\n"
            "1 1 1.0000000000000000e+00;\n"
            "2 2 3.0000000000000000e+00;\n"
            "1 3 2.0000000000000000e+00;\n"
            "];\n"
            "A = sparse(ijx(:, 1), ijx(:, 2), ijx(:, 3), 2, 3);\n");
}

TEST(host_sparse_matrix, host_device_id)
{
  csc_matrix_t<int, double> A;
  csr_matrix_t<int, double> B;
  EXPECT_EQ(A.device_id(), CUSPA_HOST_DEVICE_ID);
  EXPECT_EQ(B.device_id(), CUSPA_HOST_DEVICE_ID);
  EXPECT_EQ(A.nnz(), 0);
}

}  // namespace cuspa::host::test
