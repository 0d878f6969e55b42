/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>
#include <cmath>

#include <taint-engine/SanitizerType.h>

namespace taintengine {

std::optional<SanitizerType> sanitizer_type_from_string(
    std::string_view value) {
  if (value == "html-escape") {
    return SanitizerType::HtmlEscape;
  } else if (value == "sql-escape") {
    return SanitizerType::SqlEscape;
  } else if (value == "input-validation") {
    return SanitizerType::InputValidation;
  } else if (value == "type-conversion") {
    return SanitizerType::TypeConversion;
  } else if (value == "string-sanitize") {
    return SanitizerType::StringSanitize;
  } else if (value == "json-parse") {
    return SanitizerType::JsonParse;
  } else if (value == "crypto-hash") {
    return SanitizerType::CryptoHash;
  }
  return std::nullopt;
}

std::string_view sanitizer_type_to_string(SanitizerType type) {
  switch (type) {
    case SanitizerType::HtmlEscape:
      return "html-escape";
    case SanitizerType::SqlEscape:
      return "sql-escape";
    case SanitizerType::InputValidation:
      return "input-validation";
    case SanitizerType::TypeConversion:
      return "type-conversion";
    case SanitizerType::StringSanitize:
      return "string-sanitize";
    case SanitizerType::JsonParse:
      return "json-parse";
    case SanitizerType::CryptoHash:
      return "crypto-hash";
  }
  return "unknown-sanitizer";
}

std::ostream& operator<<(std::ostream& out, SanitizerType type) {
  return out << sanitizer_type_to_string(type);
}

double clamp_effectiveness(double effectiveness) {
  if (std::isnan(effectiveness)) {
    return 0.0;
  }
  return std::clamp(effectiveness, 0.0, 1.0);
}

} // namespace taintengine
