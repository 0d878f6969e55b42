/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <fmt/format.h>

#include <taint-engine/Position.h>

namespace taintengine {

Position Position::from_offset(std::string_view text, std::size_t offset) {
  offset = std::min(offset, text.size());
  int line = 1;
  int column = 1;
  for (std::size_t index = 0; index < offset; index++) {
    if (text[index] == '\n') {
      line++;
      column = 1;
    } else {
      column++;
    }
  }
  return Position(offset, line, column);
}

bool Position::operator==(const Position& other) const {
  return offset_ == other.offset_ && line_ == other.line_ &&
      column_ == other.column_;
}

bool Position::operator!=(const Position& other) const {
  return !this->operator==(other);
}

std::string Position::to_string() const {
  if (is_unknown()) {
    return "Position(unknown)";
  }
  return fmt::format("Position(line={}, column={})", line_, column_);
}

std::ostream& operator<<(std::ostream& out, const Position& position) {
  return out << position.to_string();
}

Json::Value Position::to_json() const {
  auto value = Json::Value(Json::objectValue);
  value["line"] = Json::Value(line_);
  value["column"] = Json::Value(column_);
  value["offset"] = Json::Value(static_cast<Json::UInt64>(offset_));
  return value;
}

} // namespace taintengine
