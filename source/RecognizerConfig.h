/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <json/json.h>

#include <taint-engine/IncludeMacros.h>
#include <taint-engine/Sanitizer.h>
#include <taint-engine/SecuritySink.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

struct SourcePattern {
  std::string pattern;
  TaintSource kind;
  TaintLevel level = TaintLevel::PossiblyTainted;
};

struct SanitizerPattern {
  std::string pattern;
  Sanitizer sanitizer;
};

struct SinkPattern {
  std::string pattern;
  SecuritySink kind;
};

/**
 * Regular expressions used to recognize sources, sanitizer calls and sinks.
 *
 * A sanitizer pattern should match the name of the called function, the
 * argument list is found by the analyzer. A sink pattern ending with `(`
 * matches a call, any other sink pattern covers the rest of the statement
 * (e.g `.innerHTML =`). A pattern with a capturing group recognizes the span
 * of its first group only, see `find_all`.
 */
class RecognizerConfig final {
 public:
  /* An empty configuration. */
  RecognizerConfig() = default;

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(RecognizerConfig)

  /* The built-in patterns. */
  static RecognizerConfig defaults();

  /**
   * Parse a configuration. Patterns extend the defaults, unless
   * `include_defaults` is false.
   *
   * Throws `JsonValidationError` on malformed input, including invalid
   * regular expressions.
   */
  static RecognizerConfig from_json(const Json::Value& value);

  void add_source(SourcePattern pattern);
  void add_sanitizer(SanitizerPattern pattern);
  void add_sink(SinkPattern pattern);

  /* Append all patterns of `other`. */
  void extend(const RecognizerConfig& other);

  const std::vector<SourcePattern>& sources() const {
    return sources_;
  }

  const std::vector<SanitizerPattern>& sanitizers() const {
    return sanitizers_;
  }

  const std::vector<SinkPattern>& sinks() const {
    return sinks_;
  }

  Json::Value to_json() const;

 private:
  std::vector<SourcePattern> sources_;
  std::vector<SanitizerPattern> sanitizers_;
  std::vector<SinkPattern> sinks_;
};

} // namespace taintengine
