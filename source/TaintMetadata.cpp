/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <taint-engine/JsonReaderWriter.h>
#include <taint-engine/TaintMetadata.h>

namespace taintengine {

std::string_view trace_step_kind_to_string(TraceStepKind kind) {
  switch (kind) {
    case TraceStepKind::Propagate:
      return "propagate";
    case TraceStepKind::Sanitize:
      return "sanitize";
    case TraceStepKind::Merge:
      return "merge";
    case TraceStepKind::Branch:
      return "branch";
  }
  return "propagate";
}

bool TaintTraceStep::operator==(const TaintTraceStep& other) const {
  return kind == other.kind && description == other.description &&
      input_level == other.input_level && output_level == other.output_level &&
      position == other.position;
}

Json::Value TaintTraceStep::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["kind"] = Json::Value(std::string(trace_step_kind_to_string(kind)));
  value["description"] = Json::Value(description);
  value["input_level"] =
      Json::Value(std::string(taint_level_to_json_string(input_level)));
  value["output_level"] =
      Json::Value(std::string(taint_level_to_json_string(output_level)));
  if (!position.is_unknown()) {
    value["position"] = position.to_json();
  }
  return value;
}

TaintMetadata::TaintMetadata(
    double confidence,
    std::set<TaintSource> sources,
    std::set<SecuritySink> sinks,
    std::set<SanitizerType> sanitizers)
    : confidence_(clamp_effectiveness(confidence)),
      sources_(std::move(sources)),
      sinks_(std::move(sinks)),
      sanitizers_(std::move(sanitizers)) {}

bool TaintMetadata::operator==(const TaintMetadata& other) const {
  return confidence_ == other.confidence_ && sources_ == other.sources_ &&
      sinks_ == other.sinks_ && sanitizers_ == other.sanitizers_ &&
      propagation_path_ == other.propagation_path_;
}

void TaintMetadata::add_source(TaintSource source) {
  sources_.insert(source);
}

void TaintMetadata::add_sink(SecuritySink sink) {
  sinks_.insert(sink);
}

void TaintMetadata::add_sanitizer(SanitizerType sanitizer) {
  sanitizers_.insert(sanitizer);
}

void TaintMetadata::add_step(TaintTraceStep step) {
  propagation_path_.push_back(std::move(step));
}

TaintMetadata TaintMetadata::merge(
    const TaintMetadata& left,
    const TaintMetadata& right) {
  auto result = left;
  result.confidence_ = std::max(left.confidence_, right.confidence_);
  result.sources_.insert(right.sources_.begin(), right.sources_.end());
  result.sinks_.insert(right.sinks_.begin(), right.sinks_.end());
  result.sanitizers_.insert(right.sanitizers_.begin(), right.sanitizers_.end());
  result.propagation_path_.insert(
      result.propagation_path_.end(),
      right.propagation_path_.begin(),
      right.propagation_path_.end());
  return result;
}

std::optional<TaintMetadata> TaintMetadata::merge(
    const std::optional<TaintMetadata>& left,
    const std::optional<TaintMetadata>& right) {
  if (left && right) {
    return merge(*left, *right);
  } else if (left) {
    return left;
  } else {
    return right;
  }
}

Json::Value TaintMetadata::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["confidence"] = Json::Value(confidence_);

  auto sources = Json::Value(Json::arrayValue);
  for (auto source : sources_) {
    sources.append(Json::Value(std::string(taint_source_to_string(source))));
  }
  value["sources"] = sources;

  auto sinks = Json::Value(Json::arrayValue);
  for (auto sink : sinks_) {
    sinks.append(Json::Value(std::string(security_sink_to_string(sink))));
  }
  value["sinks"] = sinks;

  auto sanitizers = Json::Value(Json::arrayValue);
  for (auto sanitizer : sanitizers_) {
    sanitizers.append(
        Json::Value(std::string(sanitizer_type_to_string(sanitizer))));
  }
  value["sanitizers"] = sanitizers;

  auto path = Json::Value(Json::arrayValue);
  for (const auto& step : propagation_path_) {
    path.append(step.to_json());
  }
  value["propagation_path"] = path;

  return value;
}

std::ostream& operator<<(std::ostream& out, const TaintMetadata& metadata) {
  return out << JsonWriter::to_styled_string(metadata.to_json());
}

} // namespace taintengine
