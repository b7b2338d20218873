/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/error.hpp>

#include <cxxopts.hpp>

#include <gtest/gtest.h>

#include <rmm/mr/binning_memory_resource.hpp>
#include <rmm/mr/cuda_async_memory_resource.hpp>
#include <rmm/mr/cuda_memory_resource.hpp>
#include <rmm/mr/managed_memory_resource.hpp>
#include <rmm/mr/owning_wrapper.hpp>
#include <rmm/mr/per_device_resource.hpp>
#include <rmm/mr/pool_memory_resource.hpp>

#include <memory>
#include <string>

namespace cuspa {
namespace test {

/// MR factory functions
inline auto make_cuda() { return std::make_shared<rmm::mr::cuda_memory_resource>(); }

inline auto make_async() { return std::make_shared<rmm::mr::cuda_async_memory_resource>(); }

inline auto make_managed() { return std::make_shared<rmm::mr::managed_memory_resource>(); }

inline auto make_pool()
{
  // 256MB of initial pool size, the test matrices are tiny
  const size_t initial_pool_size = 256 * 1024 * 1024;
  return rmm::mr::make_owning_wrapper<rmm::mr::pool_memory_resource>(make_async(),
                                                                     initial_pool_size);
}

inline auto make_binning()
{
  auto pool = make_pool();
  // Bins of 256KiB to 4MiB, larger allocations go to the pool
  auto mr = rmm::mr::make_owning_wrapper<rmm::mr::binning_memory_resource>(pool, 18, 22);
  return mr;
}

/**
 * @brief Creates a memory resource for the unit test environment given the name
 * of the allocation mode.
 *
 * The returned resource instance must be kept alive for the duration of the
 * tests.
 *
 * @throw cuspa::logic_error if the `allocation_mode` is unsupported.
 *
 * @param allocation_mode String identifies which resource type.
 *        Accepted types are "binning", "pool", "cuda", and "managed" only.
 * @return Memory resource instance
 */
inline std::shared_ptr<rmm::mr::device_memory_resource> create_memory_resource(
  std::string const& allocation_mode)
{
  if (allocation_mode == "binning") return make_binning();
  if (allocation_mode == "cuda") return make_cuda();
  if (allocation_mode == "pool") return make_pool();
  if (allocation_mode == "managed") return make_managed();
  CUSPA_FAIL("Invalid RMM allocation mode: %s", allocation_mode.c_str());

  // control will never reach this point
  return make_managed();
}

}  // namespace test
}  // namespace cuspa

/**
 * @brief Parses the cuspa test command line options.
 *
 * Currently only supports 'rmm_mode' string paramater, which set the rmm
 * allocation mode. The default value of the parameter is 'pool'.
 *
 * @return Parsing results in the form of cxxopts::ParseResult
 */
inline auto parse_test_options(int argc, char** argv)
{
  cxxopts::Options options(argv[0], " - cuspa tests command line options");
  options.allow_unrecognised_options().add_options()(
    "rmm_mode", "RMM allocation mode", cxxopts::value<std::string>()->default_value("pool"));
  return options.parse(argc, argv);
}

/**
 * @brief Macro that defines main function for gtest programs that use rmm
 *
 * Should be included in every test program that uses rmm allocators since it
 * maintains the lifespan of the rmm default memory resource. This `main`
 * function is a wrapper around the google test generated `main`, maintaining
 * the original functionality. In addition, this custom `main` function parses
 * the command line to customize test behavior, like the allocation mode used
 * for creating the default memory resource.
 */
#define CUSPA_TEST_PROGRAM_MAIN()                                        \
  int main(int argc, char** argv)                                        \
  {                                                                      \
    ::testing::InitGoogleTest(&argc, argv);                              \
    auto const cmd_opts = parse_test_options(argc, argv);                \
    auto const rmm_mode = cmd_opts["rmm_mode"].as<std::string>();        \
    auto resource       = cuspa::test::create_memory_resource(rmm_mode); \
    rmm::mr::set_current_device_resource(resource.get());                \
    return RUN_ALL_TESTS();                                              \
  }
