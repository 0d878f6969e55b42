/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <ostream>

#include <sparta/AbstractDomain.h>

#include <taint-engine/IncludeMacros.h>
#include <taint-engine/TaintLevel.h>

namespace taintengine {

/**
 * Abstract domain over a single taint level, with `Untainted` as bottom and
 * `HighlyTainted` as top. The domain has a finite height, widening is join.
 */
class TaintLevelDomain final : public sparta::AbstractDomain<TaintLevelDomain> {
 public:
  /* Create the bottom element. */
  TaintLevelDomain() : level_(TaintLevel::Untainted) {}

  explicit TaintLevelDomain(TaintLevel level)
      : level_(TaintLattice::normalize(level)) {}

  INCLUDE_DEFAULT_COPY_CONSTRUCTORS_AND_ASSIGNMENTS(TaintLevelDomain)

  TaintLevel level() const {
    return level_;
  }

  static TaintLevelDomain bottom() {
    return TaintLevelDomain(TaintLattice::bottom());
  }

  static TaintLevelDomain top() {
    return TaintLevelDomain(TaintLattice::top());
  }

  bool is_bottom() const {
    return TaintLattice::is_bottom(level_);
  }

  bool is_top() const {
    return TaintLattice::is_top(level_);
  }

  void set_to_bottom() {
    level_ = TaintLattice::bottom();
  }

  void set_to_top() {
    level_ = TaintLattice::top();
  }

  bool leq(const TaintLevelDomain& other) const {
    return TaintLattice::less_or_equal(level_, other.level_);
  }

  bool equals(const TaintLevelDomain& other) const {
    return level_ == other.level_;
  }

  void join_with(const TaintLevelDomain& other) {
    level_ = TaintLattice::join(level_, other.level_);
  }

  void widen_with(const TaintLevelDomain& other) {
    this->join_with(other);
  }

  void meet_with(const TaintLevelDomain& other) {
    level_ = TaintLattice::meet(level_, other.level_);
  }

  void narrow_with(const TaintLevelDomain& other) {
    this->meet_with(other);
  }

  friend std::ostream& operator<<(
      std::ostream& out,
      const TaintLevelDomain& domain) {
    return out << domain.level_;
  }

 private:
  TaintLevel level_;
};

} // namespace taintengine
