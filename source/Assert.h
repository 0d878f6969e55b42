/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <fmt/format.h>

#include <taint-engine/Debug.h>

#define te_assert(condition)                                             \
  do {                                                                   \
    if (!(condition)) {                                                  \
      taintengine::assertion_failure(#condition, __FILE__, __LINE__, ""); \
    }                                                                    \
  } while (false)
#define te_assert_log(condition, message, ...)  \
  do {                                          \
    if (!(condition)) {                         \
      taintengine::assertion_failure(           \
          #condition,                           \
          __FILE__,                             \
          __LINE__,                             \
          fmt::format(message, ##__VA_ARGS__)); \
    }                                           \
  } while (false)
