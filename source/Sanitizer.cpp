/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <fmt/format.h>

#include <taint-engine/JsonValidation.h>
#include <taint-engine/Sanitizer.h>

namespace taintengine {

Sanitizer::Sanitizer(SanitizerType type, double effectiveness)
    : type_(type), effectiveness_(clamp_effectiveness(effectiveness)) {}

bool Sanitizer::operator==(const Sanitizer& other) const {
  return type_ == other.type_ && effectiveness_ == other.effectiveness_;
}

Sanitizer Sanitizer::from_json(const Json::Value& value) {
  JsonValidation::validate_object(value);
  JsonValidation::check_unexpected_members(value, {"type", "effectiveness"});

  auto type_string = JsonValidation::string(value, /* field */ "type");
  auto type = sanitizer_type_from_string(type_string);
  if (!type) {
    throw JsonValidationError(
        value,
        /* field */ "type",
        /* expected */ "a valid sanitizer type");
  }

  auto effectiveness =
      JsonValidation::optional_number(value, /* field */ "effectiveness")
          .value_or(1.0);
  if (!(effectiveness >= 0.0 && effectiveness <= 1.0)) {
    throw JsonValidationError(
        value,
        /* field */ "effectiveness",
        /* expected */ "a number between 0 and 1");
  }

  return Sanitizer(*type, effectiveness);
}

Json::Value Sanitizer::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["type"] = Json::Value(std::string(sanitizer_type_to_string(type_)));
  value["effectiveness"] = Json::Value(effectiveness_);
  return value;
}

std::ostream& operator<<(std::ostream& out, const Sanitizer& sanitizer) {
  return out << fmt::format(
             "Sanitizer(type={}, effectiveness={})",
             sanitizer_type_to_string(sanitizer.type_),
             sanitizer.effectiveness_);
}

} // namespace taintengine
