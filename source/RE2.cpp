/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <stdexcept>
#include <string_view>

#include <fmt/format.h>
#include <re2/re2.h>

#include <taint-engine/RE2.h>

namespace taintengine {

namespace {

// We could use `std::isalnum`, but it takes into account locales and UTF8,
// which we don't care about here.
bool is_alphanumeric(char byte) {
  return (byte >= 'a' && byte <= 'z') || (byte >= 'A' && byte <= 'Z') ||
      (byte >= '0' && byte <= '9');
}

/* Return true if the given byte doesn't have a special meaning in a regular
 * expression. */
bool is_literal(char byte) {
  const std::string_view safe_bytes = "!\"#%&',-/:;<=>@_`~";
  return is_alphanumeric(byte) || safe_bytes.find(byte) != std::string::npos;
}

/* Return true if the given byte can be safely escaped. */
bool is_escapable(char byte) {
  const std::string_view escapable_bytes = "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~";
  return escapable_bytes.find(byte) != std::string::npos;
}

} // namespace

std::optional<std::string> as_string_literal(
    const re2::RE2& regular_expression) {
  if (!regular_expression.ok()) {
    return std::nullopt;
  }

  const auto& pattern = regular_expression.pattern();
  std::string result;
  result.reserve(pattern.size());

  for (std::size_t index = 0; index < pattern.size(); index++) {
    if (is_literal(pattern[index])) {
      result.push_back(pattern[index]);
    } else if (
        pattern[index] == '\\' && index + 1 < pattern.size() &&
        is_escapable(pattern[index + 1])) {
      index++;
      result.push_back(pattern[index]);
    } else {
      return std::nullopt;
    }
  }
  return result;
}

std::unique_ptr<re2::RE2> compile_regex(const std::string& pattern) {
  re2::RE2::Options options;
  options.set_log_errors(false);
  auto regex = std::make_unique<re2::RE2>(pattern, options);
  if (!regex->ok()) {
    throw std::invalid_argument(fmt::format(
        "Invalid regular expression `{}`: {}", pattern, regex->error()));
  }
  return regex;
}

std::vector<TextMatch> find_all(const re2::RE2& regex, std::string_view text) {
  std::vector<TextMatch> matches;
  re2::StringPiece input(text.data(), text.size());
  bool grouped = regex.NumberOfCapturingGroups() > 0;
  re2::StringPiece submatches[2];
  std::size_t start = 0;
  // End of the last reported span.
  std::size_t reported_end = 0;

  while (start <= text.size() &&
         regex.Match(
             input,
             start,
             text.size(),
             re2::RE2::UNANCHORED,
             submatches,
             /* nsubmatch */ grouped ? 2 : 1)) {
    const auto& match = submatches[0];
    auto offset = static_cast<std::size_t>(match.data() - text.data());
    if (!grouped) {
      if (match.size() == 0) {
        start = offset + 1;
        continue;
      }
      matches.push_back(TextMatch{offset, match.size()});
      start = offset + match.size();
      continue;
    }

    // The context around the group may overlap the next match, so the search
    // resumes right after the start of this one.
    start = offset + 1;
    const auto& group = submatches[1];
    if (group.data() == nullptr || group.size() == 0) {
      continue;
    }
    auto group_offset = static_cast<std::size_t>(group.data() - text.data());
    if (group_offset < reported_end) {
      continue;
    }
    matches.push_back(TextMatch{group_offset, group.size()});
    reported_end = group_offset + group.size();
  }
  return matches;
}

std::vector<TextMatch> find_all(
    std::string_view literal,
    std::string_view text) {
  std::vector<TextMatch> matches;
  if (literal.empty()) {
    return matches;
  }

  auto offset = text.find(literal);
  while (offset != std::string_view::npos) {
    matches.push_back(TextMatch{offset, literal.size()});
    offset = text.find(literal, offset + literal.size());
  }
  return matches;
}

} // namespace taintengine
