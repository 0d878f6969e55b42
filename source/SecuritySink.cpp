/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taint-engine/SecuritySink.h>

namespace taintengine {

std::optional<SecuritySink> security_sink_from_string(std::string_view value) {
  if (value == "database-query") {
    return SecuritySink::DatabaseQuery;
  } else if (value == "html-output") {
    return SecuritySink::HtmlOutput;
  } else if (value == "dynamic-code-execution") {
    return SecuritySink::DynamicCodeExecution;
  } else if (value == "system-command") {
    return SecuritySink::SystemCommand;
  } else if (value == "file-write") {
    return SecuritySink::FileWrite;
  } else if (value == "test-assertion") {
    return SecuritySink::TestAssertion;
  }
  return std::nullopt;
}

std::string_view security_sink_to_string(SecuritySink sink) {
  switch (sink) {
    case SecuritySink::DatabaseQuery:
      return "database-query";
    case SecuritySink::HtmlOutput:
      return "html-output";
    case SecuritySink::DynamicCodeExecution:
      return "dynamic-code-execution";
    case SecuritySink::SystemCommand:
      return "system-command";
    case SecuritySink::FileWrite:
      return "file-write";
    case SecuritySink::TestAssertion:
      return "test-assertion";
  }
  return "unknown-sink";
}

std::string_view security_sink_description(SecuritySink sink) {
  switch (sink) {
    case SecuritySink::DatabaseQuery:
      return "database query";
    case SecuritySink::HtmlOutput:
      return "HTML output";
    case SecuritySink::DynamicCodeExecution:
      return "dynamic code execution";
    case SecuritySink::SystemCommand:
      return "system command";
    case SecuritySink::FileWrite:
      return "file write";
    case SecuritySink::TestAssertion:
      return "test assertion";
  }
  return "unknown sink";
}

std::ostream& operator<<(std::ostream& out, SecuritySink sink) {
  return out << security_sink_to_string(sink);
}

} // namespace taintengine
