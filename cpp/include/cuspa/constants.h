/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#ifndef CUSPA_CONSTANTS_H
#define CUSPA_CONSTANTS_H

/* @brief Device id reported by host resident sparse structures */
#define CUSPA_HOST_DEVICE_ID -1

/* @brief Status codes constants */
#define CUSPA_SUCCESS                0
#define CUSPA_INVALID_DIMENSION      1
#define CUSPA_SHAPE_MISMATCH         2
#define CUSPA_UNSUPPORTED_CONVERSION 3
#define CUSPA_VALIDATION_ERROR       4
#define CUSPA_OUT_OF_MEMORY          5
#define CUSPA_RUNTIME_ERROR          6

#endif  // CUSPA_CONSTANTS_H
