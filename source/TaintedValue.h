/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <functional>
#include <optional>
#include <utility>

#include <taint-engine/Assert.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintMetadata.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

/**
 * An immutable value of type `T` tagged with a taint level and its
 * provenance.
 *
 * Invariant: the source is absent if and only if the level is bottom
 * (`Untainted`). Every transformation returns a new instance.
 */
template <typename T>
class TaintedValue final {
 public:
  TaintedValue(
      T value,
      TaintLevel level,
      std::optional<TaintSource> source = std::nullopt,
      std::optional<TaintMetadata> metadata = std::nullopt)
      : value_(std::move(value)),
        level_(TaintLattice::normalize(level)),
        source_(source),
        metadata_(std::move(metadata)) {
    te_assert_log(
        TaintLattice::is_bottom(level_) != source_.has_value(),
        "A value at level `{}` {} have a source",
        TaintLattice::to_string(level_),
        source_.has_value() ? "cannot" : "must");
  }

  TaintedValue(const TaintedValue&) = default;
  TaintedValue(TaintedValue&&) = default;
  TaintedValue& operator=(const TaintedValue&) = default;
  TaintedValue& operator=(TaintedValue&&) = default;
  ~TaintedValue() = default;

  static TaintedValue untainted(T value) {
    return TaintedValue(std::move(value), TaintLevel::Untainted);
  }

  const T& value() const {
    return value_;
  }

  TaintLevel level() const {
    return level_;
  }

  const std::optional<TaintSource>& source() const {
    return source_;
  }

  const std::optional<TaintMetadata>& metadata() const {
    return metadata_;
  }

  bool is_tainted() const {
    return !TaintLattice::is_bottom(level_);
  }

  /* Same value and provenance, with the given trace step appended. */
  TaintedValue with_step(TaintTraceStep step) const {
    auto metadata = metadata_.value_or(TaintMetadata());
    metadata.add_step(std::move(step));
    return TaintedValue(value_, level_, source_, std::move(metadata));
  }

  TaintedValue with_metadata(TaintMetadata metadata) const {
    return TaintedValue(value_, level_, source_, std::move(metadata));
  }

  /**
   * Combine two values. The level is the join of both levels, the value is
   * `combiner(left.value(), right.value())`. The source is the one of the
   * operand with the strictly higher level; on a tie, the left source wins.
   *
   * When either operand carries metadata, the result carries the merged
   * metadata followed by a `merge` step.
   */
  template <typename Combiner = std::plus<>>
  static TaintedValue combine(
      const TaintedValue& left,
      const TaintedValue& right,
      Combiner combiner = Combiner()) {
    auto level = TaintLattice::join(left.level_, right.level_);
    const auto& source =
        TaintLattice::height(right.level_) > TaintLattice::height(left.level_)
        ? right.source_
        : left.source_;

    auto metadata = TaintMetadata::merge(left.metadata_, right.metadata_);
    if (metadata) {
      metadata->add_step(TaintTraceStep{
          .kind = TraceStepKind::Merge,
          .description = "combine",
          .input_level = left.level_,
          .output_level = level,
          .position = Position(),
      });
    }

    return TaintedValue(
        T(combiner(left.value_, right.value_)),
        level,
        source,
        std::move(metadata));
  }

 private:
  T value_;
  TaintLevel level_;
  std::optional<TaintSource> source_;
  std::optional<TaintMetadata> metadata_;
};

} // namespace taintengine
