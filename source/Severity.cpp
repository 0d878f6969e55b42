/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taint-engine/Severity.h>

namespace taintengine {

std::string_view severity_to_string(Severity severity) {
  switch (severity) {
    case Severity::Low:
      return "low";
    case Severity::Medium:
      return "medium";
    case Severity::High:
      return "high";
    case Severity::Critical:
      return "critical";
  }
  return "critical";
}

Severity lower_severity(Severity severity) {
  switch (severity) {
    case Severity::Critical:
      return Severity::High;
    case Severity::High:
      return Severity::Medium;
    case Severity::Medium:
    case Severity::Low:
      return Severity::Low;
  }
  return severity;
}

Severity violation_severity(SecuritySink sink, TaintSource source) {
  Severity severity = Severity::Critical;
  switch (sink) {
    case SecuritySink::DynamicCodeExecution:
      return Severity::Critical;
    case SecuritySink::DatabaseQuery:
    case SecuritySink::SystemCommand:
      severity = Severity::Critical;
      break;
    case SecuritySink::HtmlOutput:
    case SecuritySink::FileWrite:
      severity = Severity::High;
      break;
    case SecuritySink::TestAssertion:
      severity = Severity::Low;
      break;
  }

  if (taint_source_risk(source) == RiskTier::Low) {
    severity = lower_severity(severity);
  }
  return severity;
}

std::ostream& operator<<(std::ostream& out, Severity severity) {
  return out << severity_to_string(severity);
}

} // namespace taintengine
