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
#include <utility>
#include <vector>

#include <taint-engine/QualifiedType.h>
#include <taint-engine/TaintLevel.h>
#include <taint-engine/TaintMetadata.h>
#include <taint-engine/TaintQualifier.h>
#include <taint-engine/TaintSource.h>
#include <taint-engine/TaintedValue.h>

namespace taintengine {

template <typename T>
struct ConversionItem {
  T value;
  TaintLevel level;
  std::optional<TaintSource> source;
  std::optional<double> confidence;
};

struct ConversionError {
  std::size_t index;
  std::string message;
};

template <typename T>
struct BatchConversion {
  std::vector<QualifiedType<T>> converted;
  std::vector<ConversionError> errors;
};

/**
 * One-way adapter from taint levels to the binary qualifiers used by
 * annotation based checkers.
 *
 * The conversion is lossy: every level above `Untainted` becomes `@Tainted`.
 * The original level is kept in the qualifier metadata for a best effort
 * reconstruction, which never yields `Untainted` for a tainted value.
 */
class TaintLevelAdapter final {
 public:
  TaintLevelAdapter() = delete;

  static TaintQualifier to_qualifier(TaintLevel level);

  template <typename T>
  static QualifiedType<T> to_qualified_type(
      T value,
      TaintLevel level,
      std::optional<TaintSource> source = std::nullopt,
      const std::optional<TaintMetadata>& metadata = std::nullopt) {
    auto qualifier_metadata = QualifierMetadata{
        .original_level = TaintLattice::normalize(level),
        .confidence = metadata ? metadata->confidence() : 1.0,
    };
    if (to_qualifier(level) == TaintQualifier::Untainted) {
      return UntaintedType<T>{std::move(value), qualifier_metadata};
    }
    return TaintedType<T>{std::move(value), source, qualifier_metadata};
  }

  template <typename T>
  static QualifiedType<T> from_tainted_value(const TaintedValue<T>& value) {
    return to_qualified_type(
        value.value(), value.level(), value.source(), value.metadata());
  }

  /**
   * Best effort reconstruction of the level. A tainted value without a
   * recorded tainted level is assumed to be `HighlyTainted`.
   */
  template <typename T>
  static TaintLevel from_qualified_type(const QualifiedType<T>& qualified) {
    if (is_untainted(qualified)) {
      return TaintLevel::Untainted;
    }
    const auto& metadata = metadata_of(qualified);
    if (metadata && !TaintLattice::is_bottom(metadata->original_level)) {
      return TaintLattice::normalize(metadata->original_level);
    }
    return TaintLevel::HighlyTainted;
  }

  /* Whether a value at `source` level can flow into a `target` location. */
  static bool is_assignment_safe(TaintLevel source, TaintLevel target);

  template <typename T>
  static bool is_assignment_safe(
      const QualifiedType<T>& value,
      TaintQualifier target) {
    return is_subtype(qualifier_of(value), target);
  }

  /* `@Tainted` wins, the left operand wins on a tie. */
  template <typename T>
  static QualifiedType<T> join(
      const QualifiedType<T>& left,
      const QualifiedType<T>& right) {
    return is_untainted(left) && is_tainted(right) ? right : left;
  }

  /* `@Untainted` wins, the left operand wins on a tie. */
  template <typename T>
  static QualifiedType<T> meet(
      const QualifiedType<T>& left,
      const QualifiedType<T>& right) {
    return is_tainted(left) && is_untainted(right) ? right : left;
  }

  /**
   * Read annotation text: `@Tainted`, `@Untainted` or key-value pairs such
   * as `level=tainted source=user-input`. Unrecognized text yields `Unknown`.
   */
  static TaintLevel from_annotation(std::string_view annotation);

  /* Error message if the item cannot be converted, nullopt otherwise. */
  static std::optional<std::string> validate(
      TaintLevel level,
      std::optional<TaintSource> source,
      std::optional<double> confidence);

  /**
   * Convert every item independently. Invalid items are skipped and reported
   * in `errors` with their index.
   */
  template <typename T>
  static BatchConversion<T> batch_convert(
      const std::vector<ConversionItem<T>>& items) {
    BatchConversion<T> result;
    for (std::size_t index = 0; index < items.size(); index++) {
      const auto& item = items[index];
      if (auto error = validate(item.level, item.source, item.confidence)) {
        result.errors.push_back(ConversionError{index, std::move(*error)});
        continue;
      }

      std::optional<TaintMetadata> metadata;
      if (item.confidence) {
        metadata = TaintMetadata(*item.confidence);
      }
      result.converted.push_back(
          to_qualified_type(item.value, item.level, item.source, metadata));
    }
    return result;
  }
};

} // namespace taintengine
