/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/logger.hpp>

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace cuspa::test {

namespace {

std::string read_file(std::string const& path)
{
  std::ifstream in(path);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

}  // namespace

TEST(logger, init_logger_writes_to_file)
{
  const std::string path = testing::TempDir() + "cuspa_logger_test.log";
  std::remove(path.c_str());
  {
    init_logger_t log(path, false);
    ASSERT_EQ(default_logger().sinks().size(), 1u);
    CUSPA_LOG_WARN("uploaded %d entries", 42);

    // A second initializer shares the live configuration
    init_logger_t nested("", true);
    EXPECT_EQ(default_logger().sinks().size(), 1u);
  }
  EXPECT_NE(read_file(path).find("uploaded 42 entries"), std::string::npos);

  // Leaving scope restores the single default sink
  ASSERT_EQ(default_logger().sinks().size(), 1u);
  testing::internal::CaptureStderr();
  CUSPA_LOG_WARN("after release");
  EXPECT_NE(testing::internal::GetCapturedStderr().find("after release"), std::string::npos);
  EXPECT_EQ(read_file(path).find("after release"), std::string::npos);
  std::remove(path.c_str());
}

TEST(logger, reset_default_logger_restores_sink)
{
  default_logger().sinks().clear();
  reset_default_logger();
  ASSERT_EQ(default_logger().sinks().size(), 1u);
  testing::internal::CaptureStderr();
  CUSPA_LOG_ERROR("restored %s", "sink");
  auto text = testing::internal::GetCapturedStderr();
  EXPECT_NE(text.find("[CUSPA]"), std::string::npos);
  EXPECT_NE(text.find("restored sink"), std::string::npos);
}

TEST(logger, debug_log_file_environment)
{
  const std::string path = testing::TempDir() + "cuspa_debug_log_file.log";
  std::remove(path.c_str());
  ASSERT_EQ(setenv("CUSPA_DEBUG_LOG_FILE", path.c_str(), 1), 0);
  reset_default_logger();
  ASSERT_EQ(default_logger().sinks().size(), 1u);
  testing::internal::CaptureStderr();
  CUSPA_LOG_WARN("shape mismatch %dx%d", 3, 4);
  EXPECT_EQ(testing::internal::GetCapturedStderr().find("shape mismatch"), std::string::npos);

  ASSERT_EQ(unsetenv("CUSPA_DEBUG_LOG_FILE"), 0);
  reset_default_logger();
  EXPECT_NE(read_file(path).find("shape mismatch 3x4"), std::string::npos);
  std::remove(path.c_str());
}

}  // namespace cuspa::test
