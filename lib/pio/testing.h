// Copyright (c) the JPEG XL Project Authors. All rights reserved.
//
// Use of this source code is governed by a BSD-style
// license that can be found in the LICENSE file.

#ifndef LIB_PIO_TESTING_H_
#define LIB_PIO_TESTING_H_

// GTest/GMock specific macros / wrappers.

#include <utility>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "lib/pio/base/status.h"

// Wrapper for StatusOr assignment in tests: aborts the test (not the binary)
// if the expression fails.
#define PIO_TEST_ASSIGN_OR_DIE(lhs, statusor) \
  PIO_TEST_ASSIGN_OR_DIE_IMPL(                \
      PIO_STATUS_MACROS_CONCAT_NAME(_status_or_value, __COUNTER__), lhs, statusor)

#define PIO_TEST_ASSIGN_OR_DIE_IMPL(name, lhs, statusor) \
  auto name = statusor;                                  \
  ASSERT_TRUE(name.ok());                                \
  lhs = std::move(name).value_();

#endif  // LIB_PIO_TESTING_H_
