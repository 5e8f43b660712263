/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <gtest/gtest.h>
#include "outcome/outcome.hpp"

#define TESTUTIL_CONCAT_IMPL(a, b) a##b
#define TESTUTIL_CONCAT(a, b) TESTUTIL_CONCAT_IMPL(a, b)
#define TESTUTIL_UNIQUE TESTUTIL_CONCAT(_outcome_result_, __LINE__)

#define EXPECT_OUTCOME_TRUE_void(var, expr)       \
  auto &&var = expr;                              \
  EXPECT_TRUE(var) << "Line " << __LINE__ << ": " \
                   << (var ? std::string{} : var.error().message());

/**
 * Checks that the expression returned a value and binds it to `val`:
 * EXPECT_OUTCOME_TRUE(boundary, locator->locate(...));
 */
#define EXPECT_OUTCOME_TRUE(val, expr)         \
  EXPECT_OUTCOME_TRUE_void(TESTUTIL_UNIQUE, expr); \
  auto &&val = TESTUTIL_UNIQUE.value();

#define EXPECT_OUTCOME_TRUE_1(expr) \
  EXPECT_OUTCOME_TRUE_void(TESTUTIL_UNIQUE, expr)

/// Checks that the expression failed with exactly the expected error
#define EXPECT_EC(expr, expected)             \
  {                                           \
    auto &&_ec_result = expr;                 \
    ASSERT_TRUE(_ec_result.has_error());      \
    EXPECT_EQ(_ec_result.error(), expected);  \
  }
