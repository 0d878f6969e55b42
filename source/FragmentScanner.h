/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace taintengine {

/* A statement as the half-open range [begin, end) of the fragment. */
struct Statement {
  std::size_t begin;
  std::size_t end;

  bool operator==(const Statement& other) const {
    return begin == other.begin && end == other.end;
  }
};

/**
 * Lightweight lexical pass over a code fragment.
 *
 * Comments and the contents of string literals are replaced by spaces in
 * `masked()`, which has the same length as the fragment. The `${...}`
 * interpolations of template literals are code and stay visible, only their
 * delimiters are masked.
 *
 * Statements are split on `;`, block braces and newlines outside of
 * parentheses, brackets and object literals. A newline does not end a
 * statement when the line ends with a binary operator, or when the next line
 * starts with one.
 *
 * A fragment with an unterminated string literal, template literal or block
 * comment, or with unbalanced parentheses or brackets, is not tokenizable.
 */
class FragmentScanner final {
 public:
  explicit FragmentScanner(std::string_view fragment);

  FragmentScanner(const FragmentScanner&) = delete;
  FragmentScanner(FragmentScanner&&) = default;
  FragmentScanner& operator=(const FragmentScanner&) = delete;
  FragmentScanner& operator=(FragmentScanner&&) = default;
  ~FragmentScanner() = default;

  bool tokenizable() const {
    return !error_.has_value();
  }

  /* Reason why the fragment is not tokenizable. */
  const std::optional<std::string>& error() const {
    return error_;
  }

  const std::string& masked() const {
    return masked_;
  }

  const std::vector<Statement>& statements() const {
    return statements_;
  }

  /* Offset of the `)` closing the `(` at `open`, if any. */
  std::optional<std::size_t> matching_parenthesis(std::size_t open) const;

 private:
  /* Mask code from `index`. Within an interpolation, stop after the `}`
   * closing it. Return the index past the masked code. */
  std::size_t mask_code(std::size_t index, bool interpolation);
  std::size_t mask_block_comment(std::size_t index);
  std::size_t mask_string(std::size_t index);
  std::size_t mask_template(std::size_t index);

  void check_balance();
  void split_statements();
  bool continues_after_newline(std::size_t newline) const;
  bool opens_expression(std::size_t brace) const;

 private:
  std::string masked_;
  std::optional<std::string> error_;
  std::vector<Statement> statements_;
};

} // namespace taintengine
