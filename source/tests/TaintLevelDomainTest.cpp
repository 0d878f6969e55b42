/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <gtest/gtest.h>

#include <taint-engine/TaintLevelDomain.h>
#include <taint-engine/tests/Test.h>

namespace taintengine {

class TaintLevelDomainTest : public test::Test {};

TEST_F(TaintLevelDomainTest, DefaultConstructor) {
  EXPECT_TRUE(TaintLevelDomain().is_bottom());
  EXPECT_TRUE(TaintLevelDomain::bottom().is_bottom());
  EXPECT_TRUE(TaintLevelDomain::top().is_top());
  EXPECT_EQ(TaintLevelDomain(), TaintLevelDomain(TaintLevel::Untainted));
  EXPECT_EQ(TaintLevelDomain(), TaintLevelDomain(TaintLevel::Sanitized));
  EXPECT_EQ(TaintLevelDomain::top(), TaintLevelDomain(TaintLevel::HighlyTainted));
  EXPECT_EQ(
      TaintLevelDomain(static_cast<TaintLevel>(200)).level(),
      TaintLevel::Unknown);
}

TEST_F(TaintLevelDomainTest, Leq) {
  EXPECT_TRUE(TaintLevelDomain::bottom().leq(TaintLevelDomain::top()));
  EXPECT_FALSE(TaintLevelDomain::top().leq(TaintLevelDomain::bottom()));
  EXPECT_TRUE(TaintLevelDomain(TaintLevel::Unknown)
                  .leq(TaintLevelDomain(TaintLevel::PossiblyTainted)));
  EXPECT_FALSE(TaintLevelDomain(TaintLevel::Tainted)
                   .leq(TaintLevelDomain(TaintLevel::PossiblyTainted)));
}

TEST_F(TaintLevelDomainTest, JoinWith) {
  auto domain = TaintLevelDomain(TaintLevel::Unknown);
  EXPECT_EQ(
      domain.join(TaintLevelDomain::bottom()),
      TaintLevelDomain(TaintLevel::Unknown));
  EXPECT_EQ(domain.join(TaintLevelDomain::top()), TaintLevelDomain::top());

  domain.join_with(TaintLevelDomain(TaintLevel::Tainted));
  EXPECT_EQ(domain.level(), TaintLevel::Tainted);

  domain.join_with(TaintLevelDomain(TaintLevel::PossiblyTainted));
  EXPECT_EQ(domain.level(), TaintLevel::Tainted);

  domain.widen_with(TaintLevelDomain::top());
  EXPECT_TRUE(domain.is_top());
}

TEST_F(TaintLevelDomainTest, MeetWith) {
  auto domain = TaintLevelDomain(TaintLevel::Tainted);
  EXPECT_EQ(domain.meet(TaintLevelDomain::top()), domain);
  EXPECT_EQ(
      domain.meet(TaintLevelDomain::bottom()), TaintLevelDomain::bottom());

  domain.meet_with(TaintLevelDomain(TaintLevel::Unknown));
  EXPECT_EQ(domain.level(), TaintLevel::Unknown);

  domain.narrow_with(TaintLevelDomain::bottom());
  EXPECT_TRUE(domain.is_bottom());
}

TEST_F(TaintLevelDomainTest, SetToBottomAndTop) {
  auto domain = TaintLevelDomain(TaintLevel::PossiblyTainted);
  domain.set_to_top();
  EXPECT_TRUE(domain.is_top());
  domain.set_to_bottom();
  EXPECT_TRUE(domain.is_bottom());
}

} // namespace taintengine
