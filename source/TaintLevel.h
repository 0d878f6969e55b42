/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

#include <taint-engine/SanitizerType.h>

namespace taintengine {

/**
 * Taint levels, totally ordered from bottom (`Untainted`) to top
 * (`HighlyTainted`). The underlying value of each level is its height.
 *
 * `Clean` and `Sanitized` are reporting aliases of `Untainted`, and
 * `LikelyTainted` and `DefinitelyTainted` both collapse into the `Tainted`
 * rank.
 */
enum class TaintLevel : std::uint8_t {
  Untainted = 0,
  Unknown = 1,
  PossiblyTainted = 2,
  Tainted = 3,
  HighlyTainted = 4,

  Clean = Untainted,
  Sanitized = Untainted,
  LikelyTainted = Tainted,
  DefinitelyTainted = Tainted,
};

/**
 * The lattice algebra over `TaintLevel`.
 *
 * Every operation is total: a value outside of the enumeration is treated as
 * `Unknown` (height 1) and never causes an exception.
 */
class TaintLattice final {
 public:
  TaintLattice() = delete;

  static constexpr int k_max_height = 4;

  static TaintLevel bottom() {
    return TaintLevel::Untainted;
  }

  static TaintLevel top() {
    return TaintLevel::HighlyTainted;
  }

  /* Least upper bound. */
  static TaintLevel join(TaintLevel left, TaintLevel right);

  /* Greatest lower bound. */
  static TaintLevel meet(TaintLevel left, TaintLevel right);

  static bool less_or_equal(TaintLevel left, TaintLevel right);

  static int height(TaintLevel level);

  /* Level of the given height, clamped to [0, k_max_height]. */
  static TaintLevel from_height(int height);

  /* Map any value, including out of range ones, to a canonical level. */
  static TaintLevel normalize(TaintLevel level);

  static bool is_bottom(TaintLevel level);
  static bool is_top(TaintLevel level);

  /**
   * Reduce `level` according to the rule of the sanitizer type. The
   * effectiveness is clamped into [0, 1]. The result is never higher than
   * the given level.
   */
  static TaintLevel apply_sanitizer(
      TaintLevel level,
      SanitizerType type,
      double effectiveness = 1.0);

  /* Diagnostic representation, e.g `HIGHLY_TAINTED`. */
  static std::string_view to_string(TaintLevel level);
};

/**
 * Parse a level name. Aliases are accepted, the comparison is case
 * insensitive and `-` is interchangeable with `_`.
 */
std::optional<TaintLevel> taint_level_from_string(std::string_view value);

/* Name used in json, e.g `highly-tainted`. */
std::string_view taint_level_to_json_string(TaintLevel level);

/* Difference of heights: negative, zero or positive like `strcmp`. */
int compare_taint_levels(TaintLevel left, TaintLevel right);

std::ostream& operator<<(std::ostream& out, TaintLevel level);

} // namespace taintengine
