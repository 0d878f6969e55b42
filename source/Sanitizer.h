/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <ostream>

#include <json/json.h>

#include <taint-engine/IncludeMacros.h>
#include <taint-engine/SanitizerType.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintedValue.h>

namespace taintengine {

/**
 * A sanitizer of a given type with an effectiveness ratio in [0, 1].
 *
 * Sanitization never increases the taint level of a value.
 */
class Sanitizer final {
 public:
  explicit Sanitizer(SanitizerType type, double effectiveness = 1.0);

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(Sanitizer)

  bool operator==(const Sanitizer& other) const;

  SanitizerType type() const {
    return type_;
  }

  double effectiveness() const {
    return effectiveness_;
  }

  TaintLevel apply(TaintLevel level) const {
    return TaintLattice::apply_sanitizer(level, type_, effectiveness_);
  }

  /**
   * Return a new value with the reduced level. The source is dropped when
   * the level reaches bottom. Transforming the value itself is up to the
   * caller.
   */
  template <typename T>
  TaintedValue<T> sanitize(const TaintedValue<T>& value) const {
    auto level = apply(value.level());
    auto source = TaintLattice::is_bottom(level)
        ? std::optional<TaintSource>()
        : value.source();

    auto metadata = value.metadata();
    if (metadata) {
      metadata->add_sanitizer(type_);
      metadata->add_step(TaintTraceStep{
          .kind = TraceStepKind::Sanitize,
          .description = std::string(sanitizer_type_to_string(type_)),
          .input_level = value.level(),
          .output_level = level,
          .position = Position(),
      });
    }

    return TaintedValue<T>(value.value(), level, source, std::move(metadata));
  }

  static Sanitizer from_json(const Json::Value& value);
  Json::Value to_json() const;

  friend std::ostream& operator<<(std::ostream& out, const Sanitizer& sanitizer);

 private:
  SanitizerType type_;
  double effectiveness_;
};

} // namespace taintengine
