/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace taintengine {

/**
 * Category of a sanitizer. Each category has a fixed level-reduction rule,
 * see `TaintLattice::apply_sanitizer`.
 */
enum class SanitizerType : unsigned int {
  HtmlEscape = 0,
  SqlEscape = 1,
  InputValidation = 2,
  TypeConversion = 3,
  StringSanitize = 4,
  JsonParse = 5,
  CryptoHash = 6,
};

std::optional<SanitizerType> sanitizer_type_from_string(std::string_view value);
std::string_view sanitizer_type_to_string(SanitizerType type);

std::ostream& operator<<(std::ostream& out, SanitizerType type);

/* Clamp an effectiveness ratio into [0, 1]. NaN is treated as 0. */
double clamp_effectiveness(double effectiveness);

} // namespace taintengine
