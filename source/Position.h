/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

#include <boost/functional/hash.hpp>
#include <json/json.h>

namespace {

constexpr int k_unknown_line = -1;
constexpr int k_unknown_column = -1;

} // namespace

namespace taintengine {

/**
 * A location within an analyzed fragment. Lines and columns start at 1.
 */
class Position final {
 public:
  Position() : offset_(0), line_(k_unknown_line), column_(k_unknown_column) {}

  Position(std::size_t offset, int line, int column)
      : offset_(offset), line_(line), column_(column) {}

  Position(const Position&) = default;
  Position(Position&&) = default;
  Position& operator=(const Position&) = default;
  Position& operator=(Position&&) = default;
  ~Position() = default;

  /* Compute the line and column of `offset` within `text`. */
  static Position from_offset(std::string_view text, std::size_t offset);

  bool operator==(const Position& other) const;
  bool operator!=(const Position& other) const;

  std::size_t offset() const {
    return offset_;
  }

  int line() const {
    return line_;
  }

  int column() const {
    return column_;
  }

  bool is_unknown() const {
    return line_ == k_unknown_line;
  }

  std::string to_string() const;
  Json::Value to_json() const;

  friend std::ostream& operator<<(std::ostream& out, const Position& position);

 private:
  friend struct std::hash<Position>;

  std::size_t offset_;
  int line_;
  int column_;
};

} // namespace taintengine

template <>
struct std::hash<taintengine::Position> {
  std::size_t operator()(const taintengine::Position& position) const {
    std::size_t seed = 0;
    boost::hash_combine(seed, position.offset_);
    boost::hash_combine(seed, position.line_);
    boost::hash_combine(seed, position.column_);
    return seed;
  }
};
