/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"
#include "common/outcome_fmt.hpp"
#include "testutil/default_print.hpp"

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TEST_CONCAT_IMPL(a, b) a##b
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TEST_CONCAT(a, b) _OUTCOME_TEST_CONCAT_IMPL(a, b)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TEST_UNIQUE(prefix) _OUTCOME_TEST_CONCAT(prefix, __LINE__)

/**
 * Expect result to hold value, discard it
 * EXPECT_OUTCOME_TRUE_1(expr);
 */
#define EXPECT_OUTCOME_TRUE_1(expr)                               \
  {                                                               \
    auto &&_r = expr;                                             \
    EXPECT_TRUE(_r) << "Line " << __LINE__ << ": "                \
                    << fmt::format("{:#}", _r.error());           \
  }

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_TRUE_NAME(tmp, val, expr)                 \
  auto &&tmp = expr;                                              \
  ASSERT_TRUE(tmp) << "Line " << __LINE__ << ": "                 \
                   << fmt::format("{:#}", tmp.error());           \
  auto &&val = tmp.value();

/**
 * Expect result to hold value and bind it, stops test on error
 * EXPECT_OUTCOME_TRUE(val, expr);
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE_NAME(_OUTCOME_TEST_UNIQUE(_r_), val, expr)

/// Same as EXPECT_OUTCOME_TRUE
#define EXPECT_OUTCOME_TRUE_2(val, expr) EXPECT_OUTCOME_TRUE(val, expr)

/**
 * Expect result to hold error, discard it
 */
#define EXPECT_OUTCOME_FALSE_1(expr) \
  {                                  \
    auto &&_r = expr;                \
    EXPECT_FALSE(_r);                \
  }

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _EXPECT_OUTCOME_FALSE_NAME(tmp, val, expr) \
  auto &&tmp = expr;                               \
  ASSERT_FALSE(tmp);                               \
  auto &&val = tmp.error();

/**
 * Expect result to hold error and bind it
 * EXPECT_OUTCOME_FALSE(error, expr);
 */
#define EXPECT_OUTCOME_FALSE(val, expr) \
  _EXPECT_OUTCOME_FALSE_NAME(_OUTCOME_TEST_UNIQUE(_r_), val, expr)

/**
 * Expect result to hold value equal to expected
 */
#define EXPECT_OUTCOME_EQ(expr, expected)                                   \
  {                                                                         \
    auto &&_r = expr;                                                       \
    EXPECT_TRUE(_r) << "Line " << __LINE__ << ": "                          \
                    << fmt::format("{:#}", _r.error());                     \
    if (_r) {                                                               \
      EXPECT_EQ(_r.value(), expected);                                      \
    }                                                                       \
  }

/**
 * Expect result to hold given error
 */
#define EXPECT_OUTCOME_ERROR(error, expr)                 \
  {                                                       \
    auto &&_r = expr;                                     \
    EXPECT_FALSE(_r);                                     \
    if (!_r) {                                            \
      EXPECT_EQ(_r.error(), make_error_code(error))       \
          << fmt::format("{:#}", _r.error());             \
    }                                                     \
  }

/**
 * Expect expression to throw std::system_error with given error
 */
#define EXPECT_OUTCOME_RAISE(error, expr)                   \
  try {                                                     \
    expr;                                                   \
    ADD_FAILURE() << "Line " << __LINE__ << ": no exception"; \
  } catch (const std::system_error &e) {                    \
    EXPECT_EQ(e.code(), make_error_code(error));            \
  }
