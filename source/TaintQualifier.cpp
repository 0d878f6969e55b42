/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <taint-engine/TaintQualifier.h>

namespace taintengine {

std::string_view taint_qualifier_to_string(TaintQualifier qualifier) {
  switch (qualifier) {
    case TaintQualifier::Untainted:
      return "@Untainted";
    case TaintQualifier::Tainted:
      return "@Tainted";
  }
  return "@Tainted";
}

bool is_subtype(TaintQualifier left, TaintQualifier right) {
  return left == right || right == TaintQualifier::Tainted;
}

TaintQualifier lub(TaintQualifier left, TaintQualifier right) {
  return is_subtype(left, right) ? right : left;
}

TaintQualifier glb(TaintQualifier left, TaintQualifier right) {
  return is_subtype(left, right) ? left : right;
}

std::ostream& operator<<(std::ostream& out, TaintQualifier qualifier) {
  return out << taint_qualifier_to_string(qualifier);
}

} // namespace taintengine
