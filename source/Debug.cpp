/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <taint-engine/Debug.h>
#include <taint-engine/Log.h>

namespace taintengine {

void assertion_failure(
    const char* condition,
    const char* file,
    int line,
    const std::string& message) {
  auto description = message.empty()
      ? fmt::format("{}:{}: assertion `{}` failed.", file, line, condition)
      : fmt::format(
            "{}:{}: assertion `{}` failed: {}", file, line, condition, message);
  ERROR(1, "{}", description);
  throw exception_with_backtrace<AssertionError>(description);
}

} // namespace taintengine
