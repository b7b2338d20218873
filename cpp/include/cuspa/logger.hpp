/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */

#pragma once

#include <cuspa/logger_macros.hpp>

#include <rapids_logger/logger.hpp>

#include <memory>
#include <string>

namespace cuspa {

/**
 * @brief Returns the default sink for the global logger.
 *
 * If the environment variable `CUSPA_DEBUG_LOG_FILE` is defined, the default sink is a sink to that
 * file. Otherwise, the default is to dump to stderr.
 *
 * @return sink_ptr The sink to use
 */
rapids_logger::sink_ptr default_sink();

/**
 * @brief Get the default logger.
 *
 * @return logger& The default logger
 */
rapids_logger::logger& default_logger();

/**
 * @brief Reset the default logger to the default settings.
 *  This is needed when we are running multiple tests and each test has different logger settings
 *  and we need to reset the logger to the default settings before each test.
 */
void reset_default_logger();

// Ref-counted logger initializer
class init_logger_t {
  // Using shared_ptr for ref-counting
  std::shared_ptr<void> guard_;

 public:
  init_logger_t(std::string log_file, bool log_to_console);
};

}  // namespace cuspa
