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
 * Where an untrusted value comes from.
 */
enum class TaintSource : unsigned int {
  UserInput = 0,
  ExternalApi = 1,
  Network = 2,
  Environment = 3,
  FileSystem = 4,
  Database = 5,
};

/**
 * Reporting-only risk tier of a taint source. It never affects the lattice.
 */
enum class RiskTier : unsigned int {
  Low = 0,
  Medium = 1,
  High = 2,
};

RiskTier taint_source_risk(TaintSource source);

std::optional<TaintSource> taint_source_from_string(std::string_view value);
std::string_view taint_source_to_string(TaintSource source);
std::string_view risk_tier_to_string(RiskTier tier);

std::ostream& operator<<(std::ostream& out, TaintSource source);

} // namespace taintengine
