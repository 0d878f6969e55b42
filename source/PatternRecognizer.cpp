/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <algorithm>

#include <taint-engine/Log.h>
#include <taint-engine/PatternRecognizer.h>

namespace taintengine {

namespace {

/* Sort by offset, longest first, and drop occurrences overlapping a
 * previous one. */
template <typename Occurrence>
std::vector<Occurrence> remove_overlaps(std::vector<Occurrence> occurrences) {
  std::stable_sort(
      occurrences.begin(),
      occurrences.end(),
      [](const Occurrence& left, const Occurrence& right) {
        if (left.offset != right.offset) {
          return left.offset < right.offset;
        }
        return left.length > right.length;
      });

  std::vector<Occurrence> result;
  std::size_t covered_until = 0;
  for (auto& occurrence : occurrences) {
    if (!result.empty() && occurrence.offset < covered_until) {
      continue;
    }
    covered_until = occurrence.offset + occurrence.length;
    result.push_back(std::move(occurrence));
  }
  return result;
}

} // namespace

TextPattern::TextPattern(const std::string& pattern)
    : regex_(compile_regex(pattern)), literal_(as_string_literal(*regex_)) {}

std::vector<TextMatch> TextPattern::find_all(std::string_view text) const {
  if (literal_) {
    return taintengine::find_all(std::string_view(*literal_), text);
  }
  return taintengine::find_all(*regex_, text);
}

PatternRecognizer::PatternRecognizer(const RecognizerConfig& config) {
  for (const auto& source : config.sources()) {
    sources_.push_back({TextPattern(source.pattern), source});
  }
  for (const auto& sanitizer : config.sanitizers()) {
    sanitizers_.push_back({TextPattern(sanitizer.pattern), sanitizer});
  }
  for (const auto& sink : config.sinks()) {
    sinks_.push_back({TextPattern(sink.pattern), sink});
  }
  LOG(3,
      "Compiled {} source, {} sanitizer and {} sink patterns.",
      sources_.size(),
      sanitizers_.size(),
      sinks_.size());
}

std::vector<SourceOccurrence> PatternRecognizer::sources(
    std::string_view text) const {
  std::vector<SourceOccurrence> occurrences;
  for (const auto& source : sources_) {
    for (const auto& match : source.matcher.find_all(text)) {
      occurrences.push_back(SourceOccurrence{
          .offset = match.offset,
          .length = match.length,
          .kind = source.pattern.kind,
          .level = source.pattern.level,
      });
    }
  }
  return remove_overlaps(std::move(occurrences));
}

std::vector<SanitizerOccurrence> PatternRecognizer::sanitizers(
    std::string_view text) const {
  std::vector<SanitizerOccurrence> occurrences;
  for (const auto& sanitizer : sanitizers_) {
    for (const auto& match : sanitizer.matcher.find_all(text)) {
      occurrences.push_back(SanitizerOccurrence{
          .offset = match.offset,
          .length = match.length,
          .sanitizer = sanitizer.pattern.sanitizer,
      });
    }
  }
  return remove_overlaps(std::move(occurrences));
}

std::vector<SinkOccurrence> PatternRecognizer::sinks(
    std::string_view text) const {
  std::vector<SinkOccurrence> occurrences;
  for (const auto& sink : sinks_) {
    for (const auto& match : sink.matcher.find_all(text)) {
      occurrences.push_back(SinkOccurrence{
          .offset = match.offset,
          .length = match.length,
          .kind = sink.pattern.kind,
      });
    }
  }
  return remove_overlaps(std::move(occurrences));
}

} // namespace taintengine
