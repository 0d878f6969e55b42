/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <set>

#include <boost/algorithm/string/trim.hpp>
#include <boost/range/adaptor/transformed.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <taint-engine/JsonReaderWriter.h>
#include <taint-engine/JsonValidation.h>

namespace taintengine {

namespace {

std::string invalid_argument_message(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected) {
  auto field_information = field ? fmt::format(" for field `{}`", *field) : "";
  return fmt::format(
      "Error validating `{}`. Expected {}{}.",
      boost::algorithm::trim_copy(JsonWriter::to_styled_string(value)),
      expected,
      field_information);
}

} // namespace

JsonValidationError::JsonValidationError(
    const Json::Value& value,
    const std::optional<std::string>& field,
    const std::string& expected)
    : std::invalid_argument(invalid_argument_message(value, field, expected)) {}

void JsonValidation::validate_object(
    const Json::Value& value,
    const std::string& expected) {
  if (value.isNull() || !value.isObject()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ expected);
  }
}

void JsonValidation::validate_object(const Json::Value& value) {
  validate_object(value, /* expected */ "non-null object");
}

std::string JsonValidation::string(const Json::Value& value) {
  if (value.isNull() || !value.isString()) {
    throw JsonValidationError(
        value, /* field */ std::nullopt, /* expected */ "string");
  }
  return value.asString();
}

std::string JsonValidation::string(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with string field `{}`", field));
  const auto& string = value[field];
  if (string.isNull() || !string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

std::optional<std::string> JsonValidation::optional_string(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with string field `{}`", field));
  const auto& string = value[field];
  if (string.isNull()) {
    return std::nullopt;
  }
  if (!string.isString()) {
    throw JsonValidationError(value, field, /* expected */ "string");
  }
  return string.asString();
}

double JsonValidation::number(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with number field `{}`", field));
  const auto& number = value[field];
  if (number.isNull() || !number.isNumeric()) {
    throw JsonValidationError(value, field, /* expected */ "number");
  }
  return number.asDouble();
}

std::optional<double> JsonValidation::optional_number(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with number field `{}`", field));
  const auto& number = value[field];
  if (number.isNull()) {
    return std::nullopt;
  }
  if (!number.isNumeric()) {
    throw JsonValidationError(value, field, /* expected */ "number");
  }
  return number.asDouble();
}

bool JsonValidation::boolean(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value, fmt::format("non-null object with boolean field `{}`", field));
  const auto& boolean = value[field];
  if (boolean.isNull() || !boolean.isBool()) {
    throw JsonValidationError(value, field, /* expected */ "boolean");
  }
  return boolean.asBool();
}

bool JsonValidation::optional_boolean(
    const Json::Value& value,
    const std::string& field,
    bool default_value) {
  validate_object(
      value, fmt::format("non-null object with boolean field `{}`", field));
  const auto& boolean = value[field];
  if (boolean.isNull()) {
    return default_value;
  }
  if (!boolean.isBool()) {
    throw JsonValidationError(value, field, /* expected */ "boolean");
  }
  return boolean.asBool();
}

const Json::Value& JsonValidation::null_or_array(
    const Json::Value& value,
    const std::string& field) {
  validate_object(
      value,
      fmt::format("non-null object with null or array field `{}`", field));
  if (!value.isMember(field)) {
    return Json::Value::nullSingleton();
  }

  const auto& null_or_array = value[field];
  if (!null_or_array.isNull() && !null_or_array.isArray()) {
    throw JsonValidationError(value, field, /* expected */ "null or array");
  }

  return null_or_array;
}

void JsonValidation::check_unexpected_members(
    const Json::Value& value,
    const std::unordered_set<std::string>& valid_members) {
  validate_object(value);

  // Sorted so that error messages are deterministic.
  std::set<std::string> sorted_members(
      valid_members.begin(), valid_members.end());
  for (const std::string& member : value.getMemberNames()) {
    if (valid_members.find(member) == valid_members.end()) {
      throw JsonValidationError(
          value,
          /* field */ std::nullopt,
          /* expected */
          fmt::format(
              "fields {}, got `{}`",
              fmt::join(
                  boost::adaptors::transform(
                      sorted_members,
                      [](const std::string& member) {
                        return fmt::format("`{}`", member);
                      }),
                  ", "),
              member));
    }
  }
}

} // namespace taintengine
