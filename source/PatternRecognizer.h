/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <re2/re2.h>

#include <taint-engine/RE2.h>
#include <taint-engine/Recognizer.h>
#include <taint-engine/RecognizerConfig.h>

namespace taintengine {

/**
 * A pattern that is either matched with a substring search, when it is
 * equivalent to a string literal, or with re2.
 */
class TextPattern final {
 public:
  /* Throws `std::invalid_argument` if the pattern is not a valid regex. */
  explicit TextPattern(const std::string& pattern);

  TextPattern(const TextPattern&) = delete;
  TextPattern(TextPattern&&) = default;
  TextPattern& operator=(const TextPattern&) = delete;
  TextPattern& operator=(TextPattern&&) = default;
  ~TextPattern() = default;

  std::vector<TextMatch> find_all(std::string_view text) const;

  bool is_literal() const {
    return literal_.has_value();
  }

 private:
  std::unique_ptr<re2::RE2> regex_;
  std::optional<std::string> literal_;
};

/**
 * Recognizer matching the regular expressions of a `RecognizerConfig`.
 *
 * When several patterns match overlapping text, the occurrence starting
 * first wins, then the longest one.
 */
class PatternRecognizer final : public Recognizer {
 public:
  explicit PatternRecognizer(const RecognizerConfig& config);

  std::vector<SourceOccurrence> sources(std::string_view text) const override;

  std::vector<SanitizerOccurrence> sanitizers(
      std::string_view text) const override;

  std::vector<SinkOccurrence> sinks(std::string_view text) const override;

 private:
  template <typename Pattern>
  struct Compiled {
    TextPattern matcher;
    Pattern pattern;
  };

  std::vector<Compiled<SourcePattern>> sources_;
  std::vector<Compiled<SanitizerPattern>> sanitizers_;
  std::vector<Compiled<SinkPattern>> sinks_;
};

} // namespace taintengine
