/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taint-engine/TaintSource.h>

namespace taintengine {

RiskTier taint_source_risk(TaintSource source) {
  switch (source) {
    case TaintSource::UserInput:
    case TaintSource::ExternalApi:
    case TaintSource::Network:
      return RiskTier::High;
    case TaintSource::FileSystem:
    case TaintSource::Database:
      return RiskTier::Medium;
    case TaintSource::Environment:
      return RiskTier::Low;
  }
  return RiskTier::Medium;
}

std::optional<TaintSource> taint_source_from_string(std::string_view value) {
  if (value == "user-input") {
    return TaintSource::UserInput;
  } else if (value == "external-api") {
    return TaintSource::ExternalApi;
  } else if (value == "network") {
    return TaintSource::Network;
  } else if (value == "environment") {
    return TaintSource::Environment;
  } else if (value == "file-system") {
    return TaintSource::FileSystem;
  } else if (value == "database") {
    return TaintSource::Database;
  }
  return std::nullopt;
}

std::string_view taint_source_to_string(TaintSource source) {
  switch (source) {
    case TaintSource::UserInput:
      return "user-input";
    case TaintSource::ExternalApi:
      return "external-api";
    case TaintSource::Network:
      return "network";
    case TaintSource::Environment:
      return "environment";
    case TaintSource::FileSystem:
      return "file-system";
    case TaintSource::Database:
      return "database";
  }
  return "unknown-source";
}

std::string_view risk_tier_to_string(RiskTier tier) {
  switch (tier) {
    case RiskTier::Low:
      return "low";
    case RiskTier::Medium:
      return "medium";
    case RiskTier::High:
      return "high";
  }
  return "medium";
}

std::ostream& operator<<(std::ostream& out, TaintSource source) {
  return out << taint_source_to_string(source);
}

} // namespace taintengine
