/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include <taint-engine/Log.h>
#include <taint-engine/TaintedValue.h>

namespace taintengine {

class TaintPropagation final {
 public:
  TaintPropagation() = delete;

  /**
   * Fold the operands of the named operation from left to right with
   * `TaintedValue::combine`.
   *
   * The result level is the join of all operand levels. The source is the
   * one of the first operand with the highest level. An empty list of
   * operands yields a default constructed, untainted value.
   */
  template <typename T, typename Combiner = std::plus<>>
  static TaintedValue<T> propagate(
      std::string_view operation,
      const std::vector<TaintedValue<T>>& operands,
      Combiner combiner = Combiner()) {
    if (operands.empty()) {
      LOG(5, "Propagating `{}` without operands", operation);
      return TaintedValue<T>::untainted(T{});
    }

    auto result = operands.front();
    for (auto operand = std::next(operands.begin()); operand != operands.end();
         ++operand) {
      result = TaintedValue<T>::combine(result, *operand, combiner);
    }

    if (result.metadata()) {
      result = result.with_step(TaintTraceStep{
          .kind = TraceStepKind::Propagate,
          .description = std::string(operation),
          .input_level = operands.front().level(),
          .output_level = result.level(),
          .position = Position(),
      });
    }

    LOG(5,
        "Propagated `{}` over {} operands: {}",
        operation,
        operands.size(),
        TaintLattice::to_string(result.level()));
    return result;
  }
};

} // namespace taintengine
