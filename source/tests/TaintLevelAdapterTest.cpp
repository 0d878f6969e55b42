/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <limits>
#include <string>

#include <gmock/gmock.h>

#include <taint-engine/TaintLevelAdapter.h>
#include <taint-engine/tests/Test.h>

namespace taintengine {

class TaintLevelAdapterTest : public test::Test {};

TEST_F(TaintLevelAdapterTest, Qualifier) {
  EXPECT_EQ(taint_qualifier_to_string(TaintQualifier::Untainted), "@Untainted");
  EXPECT_EQ(taint_qualifier_to_string(TaintQualifier::Tainted), "@Tainted");

  EXPECT_TRUE(is_subtype(TaintQualifier::Untainted, TaintQualifier::Tainted));
  EXPECT_TRUE(is_subtype(TaintQualifier::Tainted, TaintQualifier::Tainted));
  EXPECT_TRUE(
      is_subtype(TaintQualifier::Untainted, TaintQualifier::Untainted));
  EXPECT_FALSE(is_subtype(TaintQualifier::Tainted, TaintQualifier::Untainted));

  EXPECT_EQ(
      lub(TaintQualifier::Untainted, TaintQualifier::Tainted),
      TaintQualifier::Tainted);
  EXPECT_EQ(
      lub(TaintQualifier::Untainted, TaintQualifier::Untainted),
      TaintQualifier::Untainted);
  EXPECT_EQ(
      glb(TaintQualifier::Untainted, TaintQualifier::Tainted),
      TaintQualifier::Untainted);
  EXPECT_EQ(
      glb(TaintQualifier::Tainted, TaintQualifier::Tainted),
      TaintQualifier::Tainted);
}

TEST_F(TaintLevelAdapterTest, ToQualifier) {
  EXPECT_EQ(
      TaintLevelAdapter::to_qualifier(TaintLevel::Untainted),
      TaintQualifier::Untainted);
  EXPECT_EQ(
      TaintLevelAdapter::to_qualifier(TaintLevel::Sanitized),
      TaintQualifier::Untainted);
  EXPECT_EQ(
      TaintLevelAdapter::to_qualifier(TaintLevel::Unknown),
      TaintQualifier::Tainted);
  EXPECT_EQ(
      TaintLevelAdapter::to_qualifier(TaintLevel::PossiblyTainted),
      TaintQualifier::Tainted);
  EXPECT_EQ(
      TaintLevelAdapter::to_qualifier(TaintLevel::HighlyTainted),
      TaintQualifier::Tainted);
}

TEST_F(TaintLevelAdapterTest, ToQualifiedType) {
  auto untainted = TaintLevelAdapter::to_qualified_type(
      std::string("constant"), TaintLevel::Untainted);
  EXPECT_TRUE(is_untainted(untainted));
  EXPECT_EQ(qualifier_of(untainted), TaintQualifier::Untainted);
  EXPECT_EQ(value_of(untainted), "constant");

  auto tainted = TaintLevelAdapter::to_qualified_type(
      std::string("input"),
      TaintLevel::PossiblyTainted,
      TaintSource::UserInput,
      TaintMetadata(/* confidence */ 0.7));
  ASSERT_TRUE(is_tainted(tainted));
  EXPECT_EQ(std::get<TaintedType<std::string>>(tainted).source, TaintSource::UserInput);
  EXPECT_EQ(
      metadata_of(tainted),
      (QualifierMetadata{
          .original_level = TaintLevel::PossiblyTainted, .confidence = 0.7}));
}

TEST_F(TaintLevelAdapterTest, RoundTrip) {
  for (auto level : test::all_levels()) {
    auto qualified = TaintLevelAdapter::to_qualified_type(
        0,
        level,
        TaintLattice::is_bottom(level)
            ? std::nullopt
            : std::optional<TaintSource>(TaintSource::Network));
    EXPECT_EQ(TaintLevelAdapter::from_qualified_type(qualified), level);
  }

  auto highly_tainted = TaintLevelAdapter::from_tainted_value(
      TaintedValue<int>(1, TaintLevel::HighlyTainted, TaintSource::UserInput));
  EXPECT_GE(
      TaintLattice::height(
          TaintLevelAdapter::from_qualified_type(highly_tainted)),
      TaintLattice::height(TaintLevel::Tainted));

  // Without a recorded level, a tainted value is assumed highly tainted.
  auto bare = QualifiedType<int>(TaintedType<int>{1, std::nullopt, std::nullopt});
  EXPECT_EQ(
      TaintLevelAdapter::from_qualified_type(bare), TaintLevel::HighlyTainted);

  auto bare_untainted = QualifiedType<int>(UntaintedType<int>{1, std::nullopt});
  EXPECT_EQ(
      TaintLevelAdapter::from_qualified_type(bare_untainted),
      TaintLevel::Untainted);
}

TEST_F(TaintLevelAdapterTest, FromTaintedValue) {
  auto value = TaintedValue<std::string>(
      "input",
      TaintLevel::Tainted,
      TaintSource::ExternalApi,
      TaintMetadata(/* confidence */ 0.4));
  auto qualified = TaintLevelAdapter::from_tainted_value(value);
  ASSERT_TRUE(is_tainted(qualified));
  EXPECT_EQ(value_of(qualified), "input");
  EXPECT_EQ(
      std::get<TaintedType<std::string>>(qualified).source,
      TaintSource::ExternalApi);
  EXPECT_EQ(metadata_of(qualified)->confidence, 0.4);
  EXPECT_EQ(metadata_of(qualified)->original_level, TaintLevel::Tainted);

  EXPECT_TRUE(is_untainted(TaintLevelAdapter::from_tainted_value(
      TaintedValue<std::string>::untainted("constant"))));
}

TEST_F(TaintLevelAdapterTest, IsAssignmentSafe) {
  for (auto level : test::all_levels()) {
    EXPECT_TRUE(TaintLevelAdapter::is_assignment_safe(level, level));
    EXPECT_TRUE(
        TaintLevelAdapter::is_assignment_safe(level, TaintLevel::HighlyTainted));
  }
  EXPECT_FALSE(TaintLevelAdapter::is_assignment_safe(
      TaintLevel::HighlyTainted, TaintLevel::Untainted));
  EXPECT_FALSE(TaintLevelAdapter::is_assignment_safe(
      TaintLevel::Tainted, TaintLevel::PossiblyTainted));
  EXPECT_TRUE(TaintLevelAdapter::is_assignment_safe(
      TaintLevel::Unknown, TaintLevel::Tainted));

  auto tainted = TaintLevelAdapter::to_qualified_type(
      1, TaintLevel::Unknown, TaintSource::Network);
  auto untainted = TaintLevelAdapter::to_qualified_type(1, TaintLevel::Untainted);
  EXPECT_FALSE(
      TaintLevelAdapter::is_assignment_safe(tainted, TaintQualifier::Untainted));
  EXPECT_TRUE(
      TaintLevelAdapter::is_assignment_safe(tainted, TaintQualifier::Tainted));
  EXPECT_TRUE(TaintLevelAdapter::is_assignment_safe(
      untainted, TaintQualifier::Untainted));
}

TEST_F(TaintLevelAdapterTest, JoinAndMeet) {
  auto tainted = TaintLevelAdapter::to_qualified_type(
      std::string("t"), TaintLevel::Tainted, TaintSource::UserInput);
  auto other_tainted = TaintLevelAdapter::to_qualified_type(
      std::string("o"), TaintLevel::Unknown, TaintSource::Database);
  auto untainted = TaintLevelAdapter::to_qualified_type(
      std::string("u"), TaintLevel::Untainted);
  auto other_untainted = TaintLevelAdapter::to_qualified_type(
      std::string("v"), TaintLevel::Untainted);

  EXPECT_EQ(value_of(TaintLevelAdapter::join(untainted, tainted)), "t");
  EXPECT_EQ(value_of(TaintLevelAdapter::join(tainted, untainted)), "t");
  EXPECT_EQ(value_of(TaintLevelAdapter::join(tainted, other_tainted)), "t");
  EXPECT_EQ(
      value_of(TaintLevelAdapter::join(untainted, other_untainted)), "u");

  EXPECT_EQ(value_of(TaintLevelAdapter::meet(untainted, tainted)), "u");
  EXPECT_EQ(value_of(TaintLevelAdapter::meet(tainted, untainted)), "u");
  EXPECT_EQ(value_of(TaintLevelAdapter::meet(other_tainted, tainted)), "o");
  EXPECT_EQ(
      value_of(TaintLevelAdapter::meet(other_untainted, untainted)), "v");
}

TEST_F(TaintLevelAdapterTest, FromAnnotation) {
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation("@Untainted"), TaintLevel::Untainted);
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation("  @Tainted "),
      TaintLevel::HighlyTainted);
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation("level=possibly-tainted"),
      TaintLevel::PossiblyTainted);
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation(
          "source=user-input, level=LIKELY_TAINTED"),
      TaintLevel::Tainted);
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation("level=clean"), TaintLevel::Untainted);
  EXPECT_EQ(TaintLevelAdapter::from_annotation("@Nullable"), TaintLevel::Unknown);
  EXPECT_EQ(
      TaintLevelAdapter::from_annotation("level=bogus"), TaintLevel::Unknown);
  EXPECT_EQ(TaintLevelAdapter::from_annotation(""), TaintLevel::Unknown);
}

TEST_F(TaintLevelAdapterTest, Validate) {
  EXPECT_EQ(
      TaintLevelAdapter::validate(
          TaintLevel::Tainted, TaintSource::UserInput, 0.5),
      std::nullopt);
  EXPECT_EQ(
      TaintLevelAdapter::validate(
          TaintLevel::Untainted, std::nullopt, std::nullopt),
      std::nullopt);
  EXPECT_NE(
      TaintLevelAdapter::validate(
          static_cast<TaintLevel>(17), std::nullopt, std::nullopt),
      std::nullopt);
  EXPECT_NE(
      TaintLevelAdapter::validate(
          TaintLevel::Tainted, static_cast<TaintSource>(42), std::nullopt),
      std::nullopt);
  EXPECT_NE(
      TaintLevelAdapter::validate(TaintLevel::Tainted, std::nullopt, 1.5),
      std::nullopt);
  EXPECT_NE(
      TaintLevelAdapter::validate(
          TaintLevel::Tainted,
          std::nullopt,
          std::numeric_limits<double>::quiet_NaN()),
      std::nullopt);
}

TEST_F(TaintLevelAdapterTest, BatchConvert) {
  auto result = TaintLevelAdapter::batch_convert(
      std::vector<ConversionItem<std::string>>{
          {"a", TaintLevel::Untainted, std::nullopt, std::nullopt},
          {"b", TaintLevel::Tainted, TaintSource::Network, 0.9},
          {"c", static_cast<TaintLevel>(9), std::nullopt, std::nullopt},
          {"d", TaintLevel::Unknown, std::nullopt, -0.1},
          {"e", TaintLevel::HighlyTainted, TaintSource::UserInput, std::nullopt},
      });

  ASSERT_EQ(result.converted.size(), 3);
  EXPECT_EQ(value_of(result.converted[0]), "a");
  EXPECT_TRUE(is_untainted(result.converted[0]));
  EXPECT_EQ(value_of(result.converted[1]), "b");
  EXPECT_TRUE(is_tainted(result.converted[1]));
  EXPECT_EQ(metadata_of(result.converted[1])->confidence, 0.9);
  EXPECT_EQ(value_of(result.converted[2]), "e");
  EXPECT_EQ(
      TaintLevelAdapter::from_qualified_type(result.converted[2]),
      TaintLevel::HighlyTainted);

  ASSERT_EQ(result.errors.size(), 2);
  EXPECT_EQ(result.errors[0].index, 2);
  EXPECT_THAT(result.errors[0].message, testing::HasSubstr("taint level"));
  EXPECT_EQ(result.errors[1].index, 3);
  EXPECT_THAT(result.errors[1].message, testing::HasSubstr("Confidence"));

  EXPECT_THAT(
      TaintLevelAdapter::batch_convert(std::vector<ConversionItem<int>>{})
          .converted,
      testing::IsEmpty());
}

} // namespace taintengine
