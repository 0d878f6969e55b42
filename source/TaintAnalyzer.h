/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <string_view>

#include <taint-engine/AnalysisResult.h>
#include <taint-engine/Recognizer.h>
#include <taint-engine/RecognizerConfig.h>

namespace taintengine {

/**
 * Single pass, intraprocedural taint analysis of a code fragment.
 *
 * Sources, sanitizer calls and sinks are found by the recognizer. Statements
 * are then visited in order: an assignment whose right hand side holds
 * tainted operands taints the assigned variable, and tainted data reaching a
 * sink without sanitization is a violation.
 *
 * The analyzer holds no mutable state, `analyze` can be called concurrently.
 */
class TaintAnalyzer final {
 public:
  /* Analyzer using the built-in patterns. */
  TaintAnalyzer();

  explicit TaintAnalyzer(const RecognizerConfig& config);

  explicit TaintAnalyzer(std::unique_ptr<Recognizer> recognizer);

  TaintAnalyzer(const TaintAnalyzer&) = delete;
  TaintAnalyzer(TaintAnalyzer&&) = default;
  TaintAnalyzer& operator=(const TaintAnalyzer&) = delete;
  TaintAnalyzer& operator=(TaintAnalyzer&&) = default;
  ~TaintAnalyzer() = default;

  /**
   * Analyze the given fragment. A fragment that cannot be tokenized yields an
   * inconclusive result with no entries.
   */
  AnalysisResult analyze(std::string_view fragment) const;

 private:
  std::unique_ptr<Recognizer> recognizer_;
};

} // namespace taintengine
