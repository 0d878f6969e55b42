/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <variant>

#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintQualifier.h>
#include <taint-engine/TaintSource.h>

namespace taintengine {

/* The multi-valued level a qualified value was created from. */
struct QualifierMetadata {
  TaintLevel original_level;
  double confidence = 1.0;

  bool operator==(const QualifierMetadata& other) const {
    return original_level == other.original_level &&
        confidence == other.confidence;
  }
};

template <typename T>
struct UntaintedType {
  T value;
  std::optional<QualifierMetadata> metadata;

  static constexpr TaintQualifier k_qualifier = TaintQualifier::Untainted;
};

template <typename T>
struct TaintedType {
  T value;
  std::optional<TaintSource> source;
  std::optional<QualifierMetadata> metadata;

  static constexpr TaintQualifier k_qualifier = TaintQualifier::Tainted;
};

/**
 * A value carrying exactly one of the two qualifiers. The alternatives are
 * mutually exclusive by construction.
 */
template <typename T>
using QualifiedType = std::variant<UntaintedType<T>, TaintedType<T>>;

template <typename T>
TaintQualifier qualifier_of(const QualifiedType<T>& qualified) {
  return std::holds_alternative<TaintedType<T>>(qualified)
      ? TaintQualifier::Tainted
      : TaintQualifier::Untainted;
}

template <typename T>
bool is_tainted(const QualifiedType<T>& qualified) {
  return std::holds_alternative<TaintedType<T>>(qualified);
}

template <typename T>
bool is_untainted(const QualifiedType<T>& qualified) {
  return std::holds_alternative<UntaintedType<T>>(qualified);
}

template <typename T>
const T& value_of(const QualifiedType<T>& qualified) {
  return std::visit(
      [](const auto& alternative) -> const T& { return alternative.value; },
      qualified);
}

template <typename T>
const std::optional<QualifierMetadata>& metadata_of(
    const QualifiedType<T>& qualified) {
  return std::visit(
      [](const auto& alternative) -> const std::optional<QualifierMetadata>& {
        return alternative.metadata;
      },
      qualified);
}

} // namespace taintengine
