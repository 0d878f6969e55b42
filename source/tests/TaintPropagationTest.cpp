/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <string>
#include <vector>

#include <gmock/gmock.h>

#include <taint-engine/TaintPropagation.h>
#include <taint-engine/tests/Test.h>

namespace taintengine {

class TaintPropagationTest : public test::Test {};

TEST_F(TaintPropagationTest, Empty) {
  auto result = TaintPropagation::propagate(
      "concat", std::vector<TaintedValue<std::string>>{});
  EXPECT_EQ(result.value(), "");
  EXPECT_EQ(result.level(), TaintLevel::Untainted);
  EXPECT_EQ(result.source(), std::nullopt);
  EXPECT_EQ(result.metadata(), std::nullopt);
}

TEST_F(TaintPropagationTest, Single) {
  auto value =
      TaintedValue<std::string>("x", TaintLevel::Unknown, TaintSource::Network);
  auto result = TaintPropagation::propagate("identity", std::vector{value});
  EXPECT_EQ(result.value(), "x");
  EXPECT_EQ(result.level(), TaintLevel::Unknown);
  EXPECT_EQ(result.source(), TaintSource::Network);
}

TEST_F(TaintPropagationTest, FoldsLeftToRight) {
  auto result = TaintPropagation::propagate(
      "concat",
      std::vector<TaintedValue<std::string>>{
          TaintedValue<std::string>::untainted("a"),
          TaintedValue<std::string>(
              "b", TaintLevel::PossiblyTainted, TaintSource::FileSystem),
          TaintedValue<std::string>(
              "c", TaintLevel::Tainted, TaintSource::Database),
          TaintedValue<std::string>(
              "d", TaintLevel::Tainted, TaintSource::UserInput),
          TaintedValue<std::string>(
              "e", TaintLevel::Unknown, TaintSource::Environment),
      });
  EXPECT_EQ(result.value(), "abcde");
  EXPECT_EQ(result.level(), TaintLevel::Tainted);
  // First operand at the highest level.
  EXPECT_EQ(result.source(), TaintSource::Database);
}

TEST_F(TaintPropagationTest, ResultIsJoinOfOperands) {
  for (auto first : test::all_levels()) {
    for (auto second : test::all_levels()) {
      std::vector<TaintedValue<int>> operands;
      for (auto level : {first, second}) {
        if (TaintLattice::is_bottom(level)) {
          operands.push_back(TaintedValue<int>::untainted(1));
        } else {
          operands.push_back(
              TaintedValue<int>(1, level, TaintSource::ExternalApi));
        }
      }
      auto result = TaintPropagation::propagate("add", operands);
      EXPECT_EQ(result.level(), TaintLattice::join(first, second));
      EXPECT_EQ(result.value(), 2);
    }
  }
}

TEST_F(TaintPropagationTest, CustomCombiner) {
  auto result = TaintPropagation::propagate(
      "join",
      std::vector<TaintedValue<std::string>>{
          TaintedValue<std::string>::untainted("a"),
          TaintedValue<std::string>::untainted("b"),
      },
      [](const std::string& left, const std::string& right) {
        return left + "," + right;
      });
  EXPECT_EQ(result.value(), "a,b");
  EXPECT_FALSE(result.is_tainted());
}

TEST_F(TaintPropagationTest, RecordsPropagationStep) {
  auto result = TaintPropagation::propagate(
      "concat",
      std::vector<TaintedValue<std::string>>{
          TaintedValue<std::string>(
              "a",
              TaintLevel::PossiblyTainted,
              TaintSource::Network,
              TaintMetadata(/* confidence */ 0.5, {TaintSource::Network})),
          TaintedValue<std::string>(
              "b", TaintLevel::HighlyTainted, TaintSource::UserInput),
      });
  ASSERT_TRUE(result.metadata().has_value());
  const auto& path = result.metadata()->propagation_path();
  ASSERT_EQ(path.size(), 2);
  EXPECT_EQ(path[0].kind, TraceStepKind::Merge);
  EXPECT_EQ(path[1].kind, TraceStepKind::Propagate);
  EXPECT_EQ(path[1].description, "concat");
  EXPECT_EQ(path[1].input_level, TaintLevel::PossiblyTainted);
  EXPECT_EQ(path[1].output_level, TaintLevel::HighlyTainted);
  EXPECT_EQ(result.source(), TaintSource::UserInput);
}

} // namespace taintengine
