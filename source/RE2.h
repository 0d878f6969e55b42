/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

namespace taintengine {

/**
 * If the regular expression is equivalent to an equality check, return the
 * string literal, otherwise return std::nullopt.
 *
 * For instance:
 * ```
 * >>> as_string_literal(re2::RE2("escapeHtml"))
 * <<< std::optional<std::string>("escapeHtml")
 * >>> as_string_literal(re2::RE2("escape.*"))
 * <<< std::nullopt
 * ```
 */
std::optional<std::string> as_string_literal(const re2::RE2& pattern);

/**
 * Compile the given pattern, throwing `std::invalid_argument` with the error
 * reported by re2 when the pattern is not a valid regular expression.
 */
std::unique_ptr<re2::RE2> compile_regex(const std::string& pattern);

struct TextMatch {
  std::size_t offset;
  std::size_t length;

  bool operator==(const TextMatch& other) const {
    return offset == other.offset && length == other.length;
  }
};

/**
 * Return all non-overlapping matches of `regex` in `text`, left to right.
 * Empty matches are skipped.
 *
 * When `regex` has capturing groups, the span of the first group is reported
 * instead of the whole match. The rest of the match only constrains the
 * context, e.g. `(?:^|[^.])(exec)` finds `exec` but not `re.exec`.
 */
std::vector<TextMatch> find_all(const re2::RE2& regex, std::string_view text);

/**
 * Return all non-overlapping occurrences of `literal` in `text`, left to right.
 */
std::vector<TextMatch> find_all(
    std::string_view literal,
    std::string_view text);

} // namespace taintengine
