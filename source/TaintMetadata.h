/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>

#include <taint-engine/IncludeMacros.h>
#include <taint-engine/Position.h>
#include <taint-engine/SanitizerType.h>
#include <taint-engine/SecuritySink.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

enum class TraceStepKind : unsigned int {
  Propagate = 0,
  Sanitize = 1,
  Merge = 2,
  Branch = 3,
};

std::string_view trace_step_kind_to_string(TraceStepKind kind);

/**
 * One step of the path followed by a tainted value, e.g a sanitizer call.
 */
struct TaintTraceStep {
  TraceStepKind kind;
  std::string description;
  TaintLevel input_level;
  TaintLevel output_level;
  Position position;

  bool operator==(const TaintTraceStep& other) const;

  Json::Value to_json() const;
};

/**
 * Provenance attached to a tainted value: which sources, sinks and
 * sanitizers it went through and the steps that led to its current level.
 */
class TaintMetadata final {
 public:
  /* Metadata with full confidence and no provenance. */
  TaintMetadata() : confidence_(1.0) {}

  explicit TaintMetadata(
      double confidence,
      std::set<TaintSource> sources = {},
      std::set<SecuritySink> sinks = {},
      std::set<SanitizerType> sanitizers = {});

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(TaintMetadata)

  bool operator==(const TaintMetadata& other) const;

  /* Confidence in [0, 1]. */
  double confidence() const {
    return confidence_;
  }

  const std::set<TaintSource>& sources() const {
    return sources_;
  }

  const std::set<SecuritySink>& sinks() const {
    return sinks_;
  }

  const std::set<SanitizerType>& sanitizers() const {
    return sanitizers_;
  }

  const std::vector<TaintTraceStep>& propagation_path() const {
    return propagation_path_;
  }

  void add_source(TaintSource source);
  void add_sink(SecuritySink sink);
  void add_sanitizer(SanitizerType sanitizer);
  void add_step(TaintTraceStep step);

  /**
   * Merge the provenance of both operands. The confidence is the maximum
   * confidence, the propagation path is the left path followed by the right
   * one.
   */
  static TaintMetadata merge(
      const TaintMetadata& left,
      const TaintMetadata& right);

  /* Merge optional metadata, returning nullopt if both are absent. */
  static std::optional<TaintMetadata> merge(
      const std::optional<TaintMetadata>& left,
      const std::optional<TaintMetadata>& right);

  Json::Value to_json() const;

  friend std::ostream& operator<<(
      std::ostream& out,
      const TaintMetadata& metadata);

 private:
  double confidence_;
  std::set<TaintSource> sources_;
  std::set<SecuritySink> sinks_;
  std::set<SanitizerType> sanitizers_;
  std::vector<TaintTraceStep> propagation_path_;
};

} // namespace taintengine
