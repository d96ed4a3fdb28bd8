/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "common/outcome.hpp"

#define PP_CAT(a, b) PP_CAT_I(a, b)
#define PP_CAT_I(a, b) PP_CAT_II(~, a##b)
#define PP_CAT_II(p, res) res
#define UNIQUE_NAME(base) PP_CAT(base, __LINE__)

#define EXPECT_OUTCOME_TRUE_name(var, val, expr)            \
  auto &&var = expr;                                        \
  ASSERT_TRUE(var.has_value()) << "Line " << __LINE__ << ": " \
                               << var.error().message();    \
  auto &&val = var.value();

/**
 * Use this macro in GTEST with 2 arguments to assert that getResult()
 * returned VALUE and immediately get this value.
 * EXPECT_OUTCOME_TRUE(val, getResult());
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  EXPECT_OUTCOME_TRUE_name(UNIQUE_NAME(_r), val, expr)

#define EXPECT_OUTCOME_TRUE_1(expr)                                 \
  {                                                                 \
    auto &&_r = expr;                                               \
    EXPECT_TRUE(_r.has_value())                                     \
        << "Line " << __LINE__ << ": " << _r.error().message();     \
  }

#define EXPECT_OUTCOME_FALSE_1(expr)                   \
  {                                                    \
    auto &&_r = expr;                                  \
    EXPECT_TRUE(_r.has_error()) << "Line " << __LINE__; \
  }

#define EXPECT_OUTCOME_EQ(expr, value)                              \
  {                                                                 \
    auto &&_r = expr;                                               \
    EXPECT_TRUE(_r.has_value())                                     \
        << "Line " << __LINE__ << ": " << _r.error().message();     \
    if (_r.has_value()) {                                           \
      EXPECT_EQ(_r.value(), value);                                 \
    }                                                               \
  }

#define EXPECT_OUTCOME_ERROR(error, expr)               \
  {                                                     \
    auto &&_r = expr;                                   \
    EXPECT_TRUE(_r.has_error()) << "Line " << __LINE__; \
    if (_r.has_error()) {                               \
      EXPECT_EQ(_r.error(), make_error_code(error));    \
    }                                                   \
  }
