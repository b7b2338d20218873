/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/error.hpp>
#include <cuspa/logger.hpp>

#include <cuspa/host/sparse_matrix.hpp>
#include <cuspa/host/sparse_vector.hpp>

#include <cuspa/device/bsr_matrix.hpp>
#include <cuspa/device/conversions.hpp>
#include <cuspa/device/csc_matrix.hpp>
#include <cuspa/device/csr_matrix.hpp>
#include <cuspa/device/hyb_matrix.hpp>
#include <cuspa/device/matrix_views.hpp>
#include <cuspa/device/sparse_array.hpp>
#include <cuspa/device/sparse_vector.hpp>
