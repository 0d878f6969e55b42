/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <string_view>

#include <taint-engine/SecuritySink.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

enum class Severity : unsigned int {
  Low = 0,
  Medium = 1,
  High = 2,
  Critical = 3,
};

std::string_view severity_to_string(Severity severity);

/* One step down, `Low` stays `Low`. */
Severity lower_severity(Severity severity);

/**
 * Severity of tainted data from `source` reaching `sink` without
 * sanitization. Dynamic code execution is always critical, otherwise a low
 * risk source lowers the severity by one step.
 */
Severity violation_severity(SecuritySink sink, TaintSource source);

std::ostream& operator<<(std::ostream& out, Severity severity);

} // namespace taintengine
