/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>
#include <string_view>

namespace taintengine {

/**
 * Binary type qualifier understood by annotation based checkers, with
 * `@Untainted <: @Tainted`.
 */
enum class TaintQualifier : unsigned int {
  Untainted = 0,
  Tainted = 1,
};

/* Annotation text, i.e `@Untainted` or `@Tainted`. */
std::string_view taint_qualifier_to_string(TaintQualifier qualifier);

bool is_subtype(TaintQualifier left, TaintQualifier right);

/* Least upper bound: `@Tainted` unless both are `@Untainted`. */
TaintQualifier lub(TaintQualifier left, TaintQualifier right);

/* Greatest lower bound: `@Untainted` unless both are `@Tainted`. */
TaintQualifier glb(TaintQualifier left, TaintQualifier right);

std::ostream& operator<<(std::ostream& out, TaintQualifier qualifier);

} // namespace taintengine
