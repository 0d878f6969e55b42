/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include <taint-engine/Sanitizer.h>
#include <taint-engine/SecuritySink.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

struct SourceOccurrence {
  std::size_t offset;
  std::size_t length;
  TaintSource kind;
  TaintLevel level;
};

struct SanitizerOccurrence {
  std::size_t offset;
  std::size_t length;
  Sanitizer sanitizer;
};

struct SinkOccurrence {
  std::size_t offset;
  std::size_t length;
  SecuritySink kind;
};

/**
 * Finds the taint sources, sanitizer calls and sinks of a fragment.
 *
 * The text given to a recognizer has its comments and the contents of its
 * string literals replaced by spaces, offsets are preserved. Occurrences are
 * returned sorted by offset.
 */
class Recognizer {
 public:
  Recognizer() = default;
  Recognizer(const Recognizer&) = delete;
  Recognizer(Recognizer&&) = delete;
  Recognizer& operator=(const Recognizer&) = delete;
  Recognizer& operator=(Recognizer&&) = delete;
  virtual ~Recognizer() = default;

  virtual std::vector<SourceOccurrence> sources(
      std::string_view text) const = 0;

  virtual std::vector<SanitizerOccurrence> sanitizers(
      std::string_view text) const = 0;

  virtual std::vector<SinkOccurrence> sinks(std::string_view text) const = 0;
};

} // namespace taintengine
