/* clang-format off */
/*
 * SPDX-FileCopyrightText: Copyright (c) 2026, NVIDIA CORPORATION & AFFILIATES. All rights reserved.
 * SPDX-License-Identifier: Apache-2.0
 */
/* clang-format on */
#pragma once

#include "cuspa/constants.h"

#include <stdarg.h>

#include <raft/core/error.hpp>

#include <cstdio>
#include <stdexcept>
#include <string>

namespace cuspa {

/**
 * @brief Indicates different type of exceptions which cuspa might throw
 */
enum class error_type_t {
  Success               = CUSPA_SUCCESS,
  InvalidDimension      = CUSPA_INVALID_DIMENSION,
  ShapeMismatch         = CUSPA_SHAPE_MISMATCH,
  UnsupportedConversion = CUSPA_UNSUPPORTED_CONVERSION,
  ValidationError       = CUSPA_VALIDATION_ERROR,
  OutOfMemoryError      = CUSPA_OUT_OF_MEMORY,
  RuntimeError          = CUSPA_RUNTIME_ERROR
};

/**
 * @brief Exception thrown when logical precondition is violated.
 *
 * This exception should not be thrown directly and is instead thrown by
 * cuspa_expects and the CUSPA_EXPECTS and CUSPA_FAIL macros.
 *
 */
struct logic_error : public std::logic_error {
  logic_error(const logic_error& exception) = default;

  logic_error(logic_error&& exception) = default;

  logic_error(std::string const& message, error_type_t error_type)
    : std::logic_error(message), msg_(message), error_type_(error_type)
  {
  }

  logic_error& operator=(const logic_error& exception) = default;

  logic_error& operator=(logic_error&& exception) = default;

  /**
   * @brief Returns the explanatory string.
   *
   * @return Pointer to a null-terminated string with explanatory information.
   */
  const char* what() const noexcept override { return msg_.c_str(); }

  /**
   * @brief Returns the error type.
   *
   * @return The error type enum value.
   */
  error_type_t get_error_type() const noexcept { return error_type_; }

 private:
  std::string msg_;
  error_type_t error_type_;
};

/**
 * @brief Covert error enum type to string
 *
 * @param error error_type_t type enum value
 */
inline std::string error_to_string(error_type_t error)
{
  switch (error) {
    case error_type_t::Success: return std::string("Success");
    case error_type_t::InvalidDimension: return std::string("InvalidDimension");
    case error_type_t::ShapeMismatch: return std::string("ShapeMismatch");
    case error_type_t::UnsupportedConversion: return std::string("UnsupportedConversion");
    case error_type_t::ValidationError: return std::string("ValidationError");
    case error_type_t::RuntimeError: return std::string("RuntimeError");
    case error_type_t::OutOfMemoryError: return std::string("OutOfMemoryError");
  }

  return std::string("UnAccountedError");
}

/**
 * @brief Function for checking (pre-)conditions that throws an exception when a
 * condition is false
 *
 * @param[bool] cond From expression that evaluates to true or false
 * @param[error_type_t] error enum error type
 * @param[const char *] fmt String format for error message
 * @param variable set of arguments used for fmt
 * @throw cuspa::logic_error if the condition evaluates to false.
 */
inline void cuspa_expects(bool cond, error_type_t error_type, const char* fmt, ...)
{
  if (not cond) {
    va_list args;
    char msg[2048];
    va_start(args, fmt);
    vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    throw cuspa::logic_error("{\"CUSPA_ERROR_TYPE\": \"" + error_to_string(error_type) +
                               "\", \"msg\": " + "\"" + std::string(msg) + "\"}",
                             error_type);
  }
}

#define CUSPA_SET_ERROR_MSG(msg, location_prefix, fmt, ...)      \
  do {                                                           \
    char err_msg[2048]; /* NOLINT */                             \
    std::snprintf(err_msg, sizeof(err_msg), location_prefix);    \
    msg += err_msg;                                              \
    std::snprintf(err_msg, sizeof(err_msg), fmt, ##__VA_ARGS__); \
    msg += err_msg;                                              \
  } while (0)

/**
 * @brief Macro for checking (pre-)conditions that throws an exception when a
 * condition is false
 *
 * @param[in] cond Expression that evaluates to true or false
 * @param[in] fmt String literal description of the reason that cond is expected
 * to be true with optinal format tagas
 * @throw cuspa::logic_error if the condition evaluates to false.
 */
#define CUSPA_EXPECTS(cond, fmt, ...)                                           \
  do {                                                                          \
    if (!(cond)) {                                                              \
      std::string msg{};                                                        \
      CUSPA_SET_ERROR_MSG(msg, "cuspa failure - ", fmt, ##__VA_ARGS__);         \
      throw cuspa::logic_error(msg, cuspa::error_type_t::RuntimeError);         \
    }                                                                           \
  } while (0)

/**
 * @brief Indicates that an erroneous code path has been taken.
 *
 * @param[in] fmt String literal description of the reason that this code path
 * is erroneous with optinal format tagas
 * @throw always throws cuspa::logic_error
 */
#define CUSPA_FAIL(fmt, ...)                                             \
  do {                                                                   \
    std::string msg{};                                                   \
    CUSPA_SET_ERROR_MSG(msg, "cuspa failure - ", fmt, ##__VA_ARGS__);    \
    throw cuspa::logic_error(msg, cuspa::error_type_t::RuntimeError);    \
  } while (0)

}  // namespace cuspa
