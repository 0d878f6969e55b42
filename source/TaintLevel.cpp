/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cctype>
#include <string>

#include <taint-engine/TaintLevel.h>

namespace taintengine {

namespace {

// Number of ranks removed by a sanitizer, given its rule.
int strong_reduction(double effectiveness) {
  if (effectiveness >= 0.8) {
    return TaintLattice::k_max_height;
  } else if (effectiveness >= 0.25) {
    return 1;
  } else {
    return 0;
  }
}

int gradual_reduction(double effectiveness) {
  if (effectiveness >= 0.8) {
    return 2;
  } else if (effectiveness >= 0.25) {
    return 1;
  } else {
    return 0;
  }
}

int parse_reduction(double effectiveness) {
  return effectiveness >= 0.8 ? 1 : 0;
}

} // namespace

TaintLevel TaintLattice::join(TaintLevel left, TaintLevel right) {
  return from_height(std::max(height(left), height(right)));
}

TaintLevel TaintLattice::meet(TaintLevel left, TaintLevel right) {
  return from_height(std::min(height(left), height(right)));
}

bool TaintLattice::less_or_equal(TaintLevel left, TaintLevel right) {
  return height(left) <= height(right);
}

int TaintLattice::height(TaintLevel level) {
  auto value = static_cast<int>(level);
  if (value < 0 || value > k_max_height) {
    return static_cast<int>(TaintLevel::Unknown);
  }
  return value;
}

TaintLevel TaintLattice::from_height(int height) {
  return static_cast<TaintLevel>(std::clamp(height, 0, k_max_height));
}

TaintLevel TaintLattice::normalize(TaintLevel level) {
  return from_height(height(level));
}

bool TaintLattice::is_bottom(TaintLevel level) {
  return height(level) == 0;
}

bool TaintLattice::is_top(TaintLevel level) {
  return height(level) == k_max_height;
}

TaintLevel TaintLattice::apply_sanitizer(
    TaintLevel level,
    SanitizerType type,
    double effectiveness) {
  effectiveness = clamp_effectiveness(effectiveness);

  int reduction = 0;
  switch (type) {
    case SanitizerType::HtmlEscape:
    case SanitizerType::SqlEscape:
    case SanitizerType::CryptoHash:
      reduction = strong_reduction(effectiveness);
      break;
    case SanitizerType::InputValidation:
    case SanitizerType::TypeConversion:
    case SanitizerType::StringSanitize:
      reduction = gradual_reduction(effectiveness);
      break;
    case SanitizerType::JsonParse:
      reduction = parse_reduction(effectiveness);
      break;
  }

  return from_height(height(level) - reduction);
}

std::string_view TaintLattice::to_string(TaintLevel level) {
  switch (normalize(level)) {
    case TaintLevel::Untainted:
      return "UNTAINTED";
    case TaintLevel::Unknown:
      return "UNKNOWN";
    case TaintLevel::PossiblyTainted:
      return "POSSIBLY_TAINTED";
    case TaintLevel::Tainted:
      return "TAINTED";
    case TaintLevel::HighlyTainted:
      return "HIGHLY_TAINTED";
  }
  return "UNKNOWN";
}

std::optional<TaintLevel> taint_level_from_string(std::string_view value) {
  std::string name;
  name.reserve(value.size());
  for (char character : value) {
    if (character == '-') {
      name.push_back('_');
    } else {
      name.push_back(static_cast<char>(
          std::toupper(static_cast<unsigned char>(character))));
    }
  }

  if (name == "UNTAINTED" || name == "CLEAN" || name == "SANITIZED") {
    return TaintLevel::Untainted;
  } else if (name == "UNKNOWN") {
    return TaintLevel::Unknown;
  } else if (name == "POSSIBLY_TAINTED") {
    return TaintLevel::PossiblyTainted;
  } else if (
      name == "TAINTED" || name == "LIKELY_TAINTED" ||
      name == "DEFINITELY_TAINTED") {
    return TaintLevel::Tainted;
  } else if (name == "HIGHLY_TAINTED") {
    return TaintLevel::HighlyTainted;
  }
  return std::nullopt;
}

std::string_view taint_level_to_json_string(TaintLevel level) {
  switch (TaintLattice::normalize(level)) {
    case TaintLevel::Untainted:
      return "untainted";
    case TaintLevel::Unknown:
      return "unknown";
    case TaintLevel::PossiblyTainted:
      return "possibly-tainted";
    case TaintLevel::Tainted:
      return "tainted";
    case TaintLevel::HighlyTainted:
      return "highly-tainted";
  }
  return "unknown";
}

int compare_taint_levels(TaintLevel left, TaintLevel right) {
  return TaintLattice::height(left) - TaintLattice::height(right);
}

std::ostream& operator<<(std::ostream& out, TaintLevel level) {
  return out << TaintLattice::to_string(level);
}

} // namespace taintengine
