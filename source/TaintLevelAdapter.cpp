/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <taint-engine/Log.h>
#include <taint-engine/TaintLevelAdapter.h>

namespace taintengine {

TaintQualifier TaintLevelAdapter::to_qualifier(TaintLevel level) {
  return TaintLattice::is_bottom(level) ? TaintQualifier::Untainted
                                        : TaintQualifier::Tainted;
}

bool TaintLevelAdapter::is_assignment_safe(
    TaintLevel source,
    TaintLevel target) {
  return TaintLattice::less_or_equal(source, target);
}

TaintLevel TaintLevelAdapter::from_annotation(std::string_view annotation) {
  auto text = boost::algorithm::trim_copy(std::string(annotation));
  if (text == taint_qualifier_to_string(TaintQualifier::Untainted)) {
    return TaintLevel::Untainted;
  } else if (text == taint_qualifier_to_string(TaintQualifier::Tainted)) {
    return TaintLevel::HighlyTainted;
  }

  std::vector<std::string> tokens;
  boost::algorithm::split(
      tokens, text, boost::is_any_of(" \t,"), boost::token_compress_on);

  std::optional<TaintLevel> level;
  for (const auto& token : tokens) {
    auto separator = token.find('=');
    if (separator == std::string::npos) {
      continue;
    }
    auto key = token.substr(0, separator);
    auto value = token.substr(separator + 1);
    if (key == "level") {
      level = taint_level_from_string(value);
    } else if (key == "source" && !taint_source_from_string(value)) {
      LOG(5, "Ignoring unknown source `{}` in annotation `{}`", value, text);
    }
  }

  if (!level) {
    LOG(5, "Unrecognized taint annotation `{}`", text);
    return TaintLevel::Unknown;
  }
  return *level;
}

std::optional<std::string> TaintLevelAdapter::validate(
    TaintLevel level,
    std::optional<TaintSource> source,
    std::optional<double> confidence) {
  auto level_value = static_cast<int>(level);
  if (level_value < 0 || level_value > TaintLattice::k_max_height) {
    return fmt::format("Unrecognized taint level `{}`", level_value);
  }
  if (source &&
      static_cast<unsigned int>(*source) >
          static_cast<unsigned int>(TaintSource::Database)) {
    return fmt::format(
        "Unrecognized taint source `{}`", static_cast<unsigned int>(*source));
  }
  if (confidence &&
      (std::isnan(*confidence) || *confidence < 0.0 || *confidence > 1.0)) {
    return fmt::format("Confidence `{}` is not within [0, 1]", *confidence);
  }
  return std::nullopt;
}

} // namespace taintengine
