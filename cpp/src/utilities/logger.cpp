/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#include <cuspa/logger.hpp>

#include <cstdlib>
#include <iostream>
#include <mutex>

namespace cuspa {

rapids_logger::sink_ptr default_sink()
{
  auto* filename = std::getenv("CUSPA_DEBUG_LOG_FILE");
  if (filename != nullptr) {
    return std::make_shared<rapids_logger::basic_file_sink_mt>(filename, true);
  }
  return std::make_shared<rapids_logger::stderr_sink_mt>();
}

/**
 * @brief Returns the default log pattern for the global logger.
 *
 * @return std::string The default log pattern.
 */
inline std::string default_pattern() { return "[%Y-%m-%d %H:%M:%S:%f] [%n] [%-6l] %v"; }

/**
 * @brief Returns the default log level for the global logger.
 *
 * @return rapids_logger::level_enum The default log level.
 */
inline rapids_logger::level_enum default_level()
{
#if CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_TRACE
  return rapids_logger::level_enum::trace;
#elif CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_DEBUG
  return rapids_logger::level_enum::debug;
#elif CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_INFO
  return rapids_logger::level_enum::info;
#elif CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_WARN
  return rapids_logger::level_enum::warn;
#elif CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_ERROR
  return rapids_logger::level_enum::error;
#elif CUSPA_LOG_ACTIVE_LEVEL == RAPIDS_LOGGER_LOG_LEVEL_CRITICAL
  return rapids_logger::level_enum::critical;
#else
  return rapids_logger::level_enum::info;
#endif
}

rapids_logger::logger& default_logger()
{
  static rapids_logger::logger logger_ = [] {
    rapids_logger::logger logger_{"CUSPA", {default_sink()}};
    logger_.set_pattern(default_pattern());
    logger_.set_level(default_level());
    logger_.flush_on(rapids_logger::level_enum::warn);

    return logger_;
  }();

  return logger_;
}

void reset_default_logger()
{
  default_logger().sinks().clear();
  default_logger().sinks().push_back(default_sink());
  default_logger().set_pattern(default_pattern());
  default_logger().set_level(default_level());
  default_logger().flush_on(rapids_logger::level_enum::warn);
}

// Guard object whose destructor resets the logger
struct logger_config_guard {
  ~logger_config_guard() { cuspa::reset_default_logger(); }
};

// Weak reference to detect if any init_logger_t instance is still alive
static std::weak_ptr<logger_config_guard> g_active_guard;
static std::mutex g_guard_mutex;

init_logger_t::init_logger_t(std::string log_file, bool log_to_console)
{
  std::lock_guard<std::mutex> lock(g_guard_mutex);

  auto existing_guard = g_active_guard.lock();
  if (existing_guard) {
    // Reuse existing configuration, just hold a reference to keep it alive
    guard_ = existing_guard;
    return;
  }

  cuspa::default_logger().sinks().clear();

  if (log_to_console) {
    cuspa::default_logger().sinks().push_back(
      std::make_shared<rapids_logger::ostream_sink_mt>(std::cout));
  }
  if (!log_file.empty()) {
    cuspa::default_logger().sinks().push_back(
      std::make_shared<rapids_logger::basic_file_sink_mt>(log_file, true));
    cuspa::default_logger().flush_on(rapids_logger::level_enum::debug);
  }

  auto guard     = std::make_shared<logger_config_guard>();
  g_active_guard = guard;
  guard_         = guard;
}

}  // namespace cuspa
