/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <json/json.h>

#include <taint-engine/Position.h>
#include <taint-engine/SanitizerType.h>
#include <taint-engine/SecuritySink.h>
#include <taint-engine/Severity.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

struct RecognizedSource {
  std::string name;
  TaintSource kind;
  TaintLevel level;
  Position position;

  Json::Value to_json() const;
};

struct RecognizedSanitizer {
  std::string name;
  SanitizerType type;
  double effectiveness;
  Position position;

  Json::Value to_json() const;
};

struct RecognizedSink {
  std::string name;
  SecuritySink kind;
  Position position;

  Json::Value to_json() const;
};

/* An edge of the data flow, e.g from a source to the sanitizer wrapping it. */
struct TaintFlow {
  std::string from;
  std::string to;
  TaintLevel level;
  Position position;

  bool operator==(const TaintFlow& other) const;

  Json::Value to_json() const;
};

struct TaintViolation {
  Severity severity;
  std::string message;
  Position position;
  SecuritySink sink;
  std::optional<TaintSource> source;

  static constexpr const char* k_kind = "taint-violation";

  Json::Value to_json() const;
};

/* Tainted data reaching a sink through sanitizers that do not fully clean it. */
struct CoverageGap {
  std::string message;
  SecuritySink sink;
  TaintLevel residual_level;
  Position position;

  Json::Value to_json() const;
};

/**
 * Everything found in a fragment.
 *
 * An inconclusive result has no entries and must not be mistaken for a clean
 * fragment: the fragment could not be tokenized.
 */
struct AnalysisResult {
  std::vector<RecognizedSource> sources;
  std::vector<RecognizedSanitizer> sanitizers;
  std::vector<RecognizedSink> sinks;
  std::vector<TaintFlow> flows;
  std::vector<TaintViolation> violations;
  std::vector<CoverageGap> coverage_gaps;
  bool inconclusive = false;
  std::optional<std::string> inconclusive_reason;

  static AnalysisResult make_inconclusive(std::string reason);

  /* Conclusive and without any violation. */
  bool clean() const {
    return !inconclusive && violations.empty();
  }

  Json::Value to_json() const;
};

} // namespace taintengine
