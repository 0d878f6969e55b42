/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace taintengine {

/**
 * An operation where tainted data becomes dangerous.
 */
enum class SecuritySink : unsigned int {
  DatabaseQuery = 0,
  HtmlOutput = 1,
  DynamicCodeExecution = 2,
  SystemCommand = 3,
  FileWrite = 4,
  TestAssertion = 5,
};

std::optional<SecuritySink> security_sink_from_string(std::string_view value);
std::string_view security_sink_to_string(SecuritySink sink);

/* Human readable description used in violation messages. */
std::string_view security_sink_description(SecuritySink sink);

std::ostream& operator<<(std::ostream& out, SecuritySink sink);

} // namespace taintengine
