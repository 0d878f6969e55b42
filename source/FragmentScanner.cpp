/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cctype>

#include <fmt/format.h>

#include <taint-engine/FragmentScanner.h>
#include <taint-engine/Log.h>

namespace taintengine {

namespace {

bool is_blank(std::string_view text, std::size_t begin, std::size_t end) {
  for (auto index = begin; index < end; index++) {
    if (!std::isspace(static_cast<unsigned char>(text[index]))) {
      return false;
    }
  }
  return true;
}

char closing_of(char open) {
  return open == '(' ? ')' : ']';
}

bool is_identifier_character(char character) {
  return std::isalnum(static_cast<unsigned char>(character)) ||
      character == '_' || character == '$';
}

// Operators continuing an expression on the next line.
constexpr std::string_view k_line_end_operators = "+-*/%=&|^<>?:,.";
constexpr std::string_view k_line_start_operators = ".+-*/%&|^?:=<>";
// Operators after which `{` opens an object literal.
constexpr std::string_view k_expression_operators = "=,?&|";

bool is_operator(char character, std::string_view operators) {
  return operators.find(character) != std::string_view::npos;
}

std::optional<std::size_t> previous_non_blank(
    std::string_view text,
    std::size_t end) {
  while (end > 0) {
    end--;
    if (!std::isspace(static_cast<unsigned char>(text[end]))) {
      return end;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> next_non_blank(
    std::string_view text,
    std::size_t begin) {
  for (auto index = begin; index < text.size(); index++) {
    if (!std::isspace(static_cast<unsigned char>(text[index]))) {
      return index;
    }
  }
  return std::nullopt;
}

} // namespace

FragmentScanner::FragmentScanner(std::string_view fragment)
    : masked_(fragment) {
  mask_code(0, /* interpolation */ false);
  if (error_) {
    LOG(3, "Fragment is not tokenizable: {}", *error_);
    return;
  }
  check_balance();
  if (error_) {
    LOG(3, "Fragment is not tokenizable: {}", *error_);
    return;
  }
  split_statements();
}

std::size_t FragmentScanner::mask_code(std::size_t index, bool interpolation) {
  auto start = index;
  auto size = masked_.size();
  int braces = 0;

  while (index < size && !error_) {
    char current = masked_[index];
    char next = index + 1 < size ? masked_[index + 1] : '\0';

    if (current == '/' && next == '/') {
      while (index < size && masked_[index] != '\n') {
        masked_[index++] = ' ';
      }
    } else if (current == '/' && next == '*') {
      index = mask_block_comment(index);
    } else if (current == '"' || current == '\'') {
      index = mask_string(index);
    } else if (current == '`') {
      index = mask_template(index);
    } else if (interpolation && current == '{') {
      braces++;
      index++;
    } else if (interpolation && current == '}') {
      if (braces == 0) {
        masked_[index] = ' ';
        return index + 1;
      }
      braces--;
      index++;
    } else {
      index++;
    }
  }

  if (interpolation && !error_) {
    error_ = fmt::format(
        "unterminated template literal interpolation at offset {}", start - 2);
  }
  return size;
}

std::size_t FragmentScanner::mask_block_comment(std::size_t index) {
  auto start = index;
  auto size = masked_.size();
  masked_[index++] = ' ';
  masked_[index++] = ' ';
  while (index < size) {
    if (masked_[index] == '*' && index + 1 < size &&
        masked_[index + 1] == '/') {
      masked_[index++] = ' ';
      masked_[index++] = ' ';
      return index;
    }
    if (masked_[index] != '\n') {
      masked_[index] = ' ';
    }
    index++;
  }
  error_ = fmt::format("unterminated block comment at offset {}", start);
  return size;
}

std::size_t FragmentScanner::mask_string(std::size_t index) {
  auto start = index;
  auto size = masked_.size();
  auto quote = masked_[index++];
  while (index < size) {
    char character = masked_[index];
    if (character == '\\' && index + 1 < size) {
      masked_[index++] = ' ';
      if (masked_[index] != '\n') {
        masked_[index] = ' ';
      }
      index++;
      continue;
    }
    if (character == quote) {
      return index + 1;
    }
    if (character == '\n') {
      break;
    }
    masked_[index++] = ' ';
  }
  error_ = fmt::format("unterminated string literal at offset {}", start);
  return size;
}

// The text of a template literal is masked, newlines included. Its
// interpolations are masked as code.
std::size_t FragmentScanner::mask_template(std::size_t index) {
  auto start = index;
  auto size = masked_.size();
  index++;
  while (index < size) {
    char character = masked_[index];
    if (character == '\\' && index + 1 < size) {
      masked_[index++] = ' ';
      masked_[index++] = ' ';
      continue;
    }
    if (character == '`') {
      return index + 1;
    }
    if (character == '$' && index + 1 < size && masked_[index + 1] == '{') {
      masked_[index++] = ' ';
      masked_[index++] = ' ';
      index = mask_code(index, /* interpolation */ true);
      if (error_) {
        return size;
      }
      continue;
    }
    masked_[index++] = ' ';
  }
  error_ = fmt::format("unterminated template literal at offset {}", start);
  return size;
}

void FragmentScanner::check_balance() {
  std::vector<std::pair<char, std::size_t>> stack;
  for (std::size_t index = 0; index < masked_.size(); index++) {
    char character = masked_[index];
    if (character == '(' || character == '[') {
      stack.emplace_back(character, index);
    } else if (character == ')' || character == ']') {
      if (stack.empty() || closing_of(stack.back().first) != character) {
        error_ =
            fmt::format("unbalanced `{}` at offset {}", character, index);
        return;
      }
      stack.pop_back();
    }
  }
  if (!stack.empty()) {
    error_ = fmt::format(
        "unclosed `{}` at offset {}", stack.back().first, stack.back().second);
  }
}

void FragmentScanner::split_statements() {
  // Nesting of parentheses, brackets and braces opening an expression.
  int depth = 0;
  std::size_t begin = 0;

  auto close_statement = [&](std::size_t end) {
    if (!is_blank(masked_, begin, end)) {
      statements_.push_back(Statement{begin, end});
    }
    begin = end + 1;
  };

  for (std::size_t index = 0; index < masked_.size(); index++) {
    char character = masked_[index];
    if (character == '(' || character == '[') {
      depth++;
    } else if (character == ')' || character == ']') {
      depth--;
    } else if (character == '{') {
      if (depth > 0 || opens_expression(index)) {
        depth++;
      } else {
        close_statement(index);
      }
    } else if (character == '}') {
      if (depth > 0) {
        depth--;
      } else {
        close_statement(index);
      }
    } else if (depth == 0 && character == ';') {
      close_statement(index);
    } else if (
        depth == 0 && character == '\n' && !continues_after_newline(index)) {
      close_statement(index);
    }
  }
  if (begin < masked_.size()) {
    close_statement(masked_.size());
  }
}

bool FragmentScanner::continues_after_newline(std::size_t newline) const {
  if (auto previous = previous_non_blank(masked_, newline)) {
    char character = masked_[*previous];
    bool postfix = (character == '+' || character == '-') && *previous > 0 &&
        masked_[*previous - 1] == character;
    if (is_operator(character, k_line_end_operators) && !postfix) {
      return true;
    }
  }
  if (auto next = next_non_blank(masked_, newline + 1)) {
    char character = masked_[*next];
    bool prefix = (character == '+' || character == '-') &&
        *next + 1 < masked_.size() && masked_[*next + 1] == character;
    if (is_operator(character, k_line_start_operators) && !prefix) {
      return true;
    }
  }
  return false;
}

bool FragmentScanner::opens_expression(std::size_t brace) const {
  auto previous = previous_non_blank(masked_, brace);
  if (!previous) {
    return false;
  }
  if (is_operator(masked_[*previous], k_expression_operators)) {
    return true;
  }
  // `return {`
  auto keyword = std::string_view("return");
  auto end = *previous + 1;
  return end >= keyword.size() &&
      std::string_view(masked_).substr(end - keyword.size(), keyword.size()) ==
      keyword &&
      (end == keyword.size() ||
       !is_identifier_character(masked_[end - keyword.size() - 1]));
}

std::optional<std::size_t> FragmentScanner::matching_parenthesis(
    std::size_t open) const {
  if (open >= masked_.size() || masked_[open] != '(') {
    return std::nullopt;
  }
  int depth = 0;
  for (auto index = open; index < masked_.size(); index++) {
    if (masked_[index] == '(') {
      depth++;
    } else if (masked_[index] == ')') {
      depth--;
      if (depth == 0) {
        return index;
      }
    }
  }
  return std::nullopt;
}

} // namespace taintengine
