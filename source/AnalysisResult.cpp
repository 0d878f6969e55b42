/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taint-engine/AnalysisResult.h>

namespace taintengine {

namespace {

template <typename Element>
Json::Value to_json_array(const std::vector<Element>& elements) {
  auto value = Json::Value(Json::arrayValue);
  for (const auto& element : elements) {
    value.append(element.to_json());
  }
  return value;
}

Json::Value json_string(std::string_view string) {
  return Json::Value(std::string(string));
}

} // namespace

Json::Value RecognizedSource::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["name"] = Json::Value(name);
  value["kind"] = json_string(taint_source_to_string(kind));
  value["risk"] = json_string(risk_tier_to_string(taint_source_risk(kind)));
  value["level"] = json_string(taint_level_to_json_string(level));
  value["position"] = position.to_json();
  return value;
}

Json::Value RecognizedSanitizer::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["name"] = Json::Value(name);
  value["type"] = json_string(sanitizer_type_to_string(type));
  value["effectiveness"] = Json::Value(effectiveness);
  value["position"] = position.to_json();
  return value;
}

Json::Value RecognizedSink::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["name"] = Json::Value(name);
  value["kind"] = json_string(security_sink_to_string(kind));
  value["position"] = position.to_json();
  return value;
}

bool TaintFlow::operator==(const TaintFlow& other) const {
  return from == other.from && to == other.to && level == other.level &&
      position == other.position;
}

Json::Value TaintFlow::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["from"] = Json::Value(from);
  value["to"] = Json::Value(to);
  value["level"] = json_string(taint_level_to_json_string(level));
  value["position"] = position.to_json();
  return value;
}

Json::Value TaintViolation::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["kind"] = Json::Value(k_kind);
  value["severity"] = json_string(severity_to_string(severity));
  value["message"] = Json::Value(message);
  value["sink"] = json_string(security_sink_to_string(sink));
  if (source) {
    value["source"] = json_string(taint_source_to_string(*source));
  }
  value["position"] = position.to_json();
  return value;
}

Json::Value CoverageGap::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["message"] = Json::Value(message);
  value["sink"] = json_string(security_sink_to_string(sink));
  value["residual_level"] =
      json_string(taint_level_to_json_string(residual_level));
  value["position"] = position.to_json();
  return value;
}

AnalysisResult AnalysisResult::make_inconclusive(std::string reason) {
  AnalysisResult result;
  result.inconclusive = true;
  result.inconclusive_reason = std::move(reason);
  return result;
}

Json::Value AnalysisResult::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["inconclusive"] = Json::Value(inconclusive);
  if (inconclusive_reason) {
    value["inconclusive_reason"] = Json::Value(*inconclusive_reason);
  }
  value["sources"] = to_json_array(sources);
  value["sanitizers"] = to_json_array(sanitizers);
  value["sinks"] = to_json_array(sinks);
  value["flows"] = to_json_array(flows);
  value["violations"] = to_json_array(violations);
  value["coverage_gaps"] = to_json_array(coverage_gaps);
  return value;
}

} // namespace taintengine
