/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <raft/util/cudart_utils.hpp>

#include <rmm/cuda_stream_view.hpp>
#include <rmm/device_uvector.hpp>

#include <vector>

namespace cuspa {

/**
 * @brief Simple utility function to copy device ptr to host
 *
 * @tparam T
 * @param device_ptr
 * @param size
 * @param stream_view
 * @return auto
 */
template <typename T>
auto host_copy(T const* device_ptr, size_t size, rmm::cuda_stream_view stream_view)
{
  if (!device_ptr || size == 0) return std::vector<T>{};
  std::vector<T> host_vec(size);
  raft::copy(host_vec.data(), device_ptr, size, stream_view);
  stream_view.synchronize();
  return host_vec;
}

/**
 * @brief Simple utility function to copy device vector to host
 *
 * @tparam T
 * @param device_vec
 * @param stream_view
 * @return auto
 */
template <typename T>
auto host_copy(rmm::device_uvector<T> const& device_vec, rmm::cuda_stream_view stream_view)
{
  return host_copy(device_vec.data(), device_vec.size(), stream_view);
}

/**
 * @brief Simple utility function to copy device_uvector into a new device_uvector
 *
 * @tparam T
 * @param[in] device_vec
 * @param[in] stream_view
 * @return device_vec
 */
template <typename T>
inline rmm::device_uvector<T> device_copy(rmm::device_uvector<T> const& device_vec,
                                          rmm::cuda_stream_view stream_view)
{
  rmm::device_uvector<T> device_vec_copy(device_vec.size(), stream_view);
  raft::copy(device_vec_copy.data(), device_vec.data(), device_vec.size(), stream_view);
  return device_vec_copy;
}

/**
 * @brief Simple utility function to copy std::vector to device
 *
 * @tparam T
 * @param[in] host_vec
 * @param[in] stream_view
 * @return device_vec
 */
template <typename T, typename Allocator>
inline auto device_copy(std::vector<T, Allocator> const& host_vec,
                        rmm::cuda_stream_view stream_view)
{
  rmm::device_uvector<T> device_vec(host_vec.size(), stream_view);
  raft::copy(device_vec.data(), host_vec.data(), host_vec.size(), stream_view);
  return device_vec;
}

// resizes dst_vec to the size of src_vec and overwrites its content
template <typename T>
inline void overwrite_device_copy(rmm::device_uvector<T>& dst_vec,
                                  rmm::device_uvector<T> const& src_vec,
                                  rmm::cuda_stream_view stream_view)
{
  if (src_vec.size() != dst_vec.size()) { dst_vec.resize(src_vec.size(), stream_view); }
  raft::copy(dst_vec.data(), src_vec.data(), src_vec.size(), stream_view);
}

}  // namespace cuspa
