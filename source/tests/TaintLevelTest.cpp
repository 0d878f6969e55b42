/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <limits>

#include <gmock/gmock.h>

#include <taint-engine/TaintLevel.h>
#include <taint-engine/tests/Test.h>

namespace taintengine {

class TaintLevelTest : public test::Test {};

namespace {

const std::vector<SanitizerType> k_sanitizer_types = {
    SanitizerType::HtmlEscape,
    SanitizerType::SqlEscape,
    SanitizerType::InputValidation,
    SanitizerType::TypeConversion,
    SanitizerType::StringSanitize,
    SanitizerType::JsonParse,
    SanitizerType::CryptoHash,
};

} // namespace

TEST_F(TaintLevelTest, Height) {
  EXPECT_EQ(TaintLattice::height(TaintLevel::Untainted), 0);
  EXPECT_EQ(TaintLattice::height(TaintLevel::Unknown), 1);
  EXPECT_EQ(TaintLattice::height(TaintLevel::PossiblyTainted), 2);
  EXPECT_EQ(TaintLattice::height(TaintLevel::Tainted), 3);
  EXPECT_EQ(TaintLattice::height(TaintLevel::HighlyTainted), 4);

  // Aliases.
  EXPECT_EQ(TaintLattice::height(TaintLevel::Sanitized), 0);
  EXPECT_EQ(TaintLattice::height(TaintLevel::Clean), 0);
  EXPECT_EQ(TaintLattice::height(TaintLevel::LikelyTainted), 3);
  EXPECT_EQ(TaintLattice::height(TaintLevel::DefinitelyTainted), 3);

  // Out of range values are treated as unknown.
  EXPECT_EQ(TaintLattice::height(static_cast<TaintLevel>(42)), 1);
  EXPECT_EQ(
      TaintLattice::normalize(static_cast<TaintLevel>(255)),
      TaintLevel::Unknown);
}

TEST_F(TaintLevelTest, BottomAndTop) {
  EXPECT_TRUE(TaintLattice::is_bottom(TaintLevel::Untainted));
  EXPECT_TRUE(TaintLattice::is_bottom(TaintLevel::Sanitized));
  EXPECT_FALSE(TaintLattice::is_bottom(TaintLevel::Unknown));
  EXPECT_TRUE(TaintLattice::is_top(TaintLevel::HighlyTainted));
  EXPECT_FALSE(TaintLattice::is_top(TaintLevel::Tainted));
  EXPECT_EQ(TaintLattice::bottom(), TaintLevel::Untainted);
  EXPECT_EQ(TaintLattice::top(), TaintLevel::HighlyTainted);
}

TEST_F(TaintLevelTest, PartialOrder) {
  for (auto left : test::all_levels()) {
    EXPECT_TRUE(TaintLattice::less_or_equal(left, left));

    for (auto right : test::all_levels()) {
      if (TaintLattice::less_or_equal(left, right) &&
          TaintLattice::less_or_equal(right, left)) {
        EXPECT_EQ(left, right);
      }

      for (auto other : test::all_levels()) {
        if (TaintLattice::less_or_equal(left, right) &&
            TaintLattice::less_or_equal(right, other)) {
          EXPECT_TRUE(TaintLattice::less_or_equal(left, other));
        }
      }
    }
  }

  EXPECT_TRUE(
      TaintLattice::less_or_equal(TaintLevel::Untainted, TaintLevel::Unknown));
  EXPECT_FALSE(
      TaintLattice::less_or_equal(TaintLevel::Unknown, TaintLevel::Untainted));
}

TEST_F(TaintLevelTest, JoinAndMeet) {
  for (auto left : test::all_levels()) {
    EXPECT_EQ(TaintLattice::join(left, left), left);
    EXPECT_EQ(TaintLattice::meet(left, left), left);

    for (auto right : test::all_levels()) {
      auto join = TaintLattice::join(left, right);
      auto meet = TaintLattice::meet(left, right);

      EXPECT_EQ(join, TaintLattice::join(right, left));
      EXPECT_EQ(meet, TaintLattice::meet(right, left));

      EXPECT_TRUE(TaintLattice::less_or_equal(left, join));
      EXPECT_TRUE(TaintLattice::less_or_equal(right, join));
      EXPECT_TRUE(TaintLattice::less_or_equal(meet, left));
      EXPECT_TRUE(TaintLattice::less_or_equal(meet, right));

      for (auto other : test::all_levels()) {
        EXPECT_EQ(
            TaintLattice::join(TaintLattice::join(left, right), other),
            TaintLattice::join(left, TaintLattice::join(right, other)));
        EXPECT_EQ(
            TaintLattice::meet(TaintLattice::meet(left, right), other),
            TaintLattice::meet(left, TaintLattice::meet(right, other)));
      }
    }
  }

  EXPECT_EQ(
      TaintLattice::join(TaintLevel::Unknown, TaintLevel::PossiblyTainted),
      TaintLevel::PossiblyTainted);
  EXPECT_EQ(
      TaintLattice::meet(TaintLevel::Unknown, TaintLevel::PossiblyTainted),
      TaintLevel::Unknown);
  EXPECT_EQ(
      TaintLattice::join(TaintLevel::Sanitized, TaintLevel::LikelyTainted),
      TaintLevel::Tainted);
}

TEST_F(TaintLevelTest, ApplySanitizerStrongRule) {
  for (auto type :
       {SanitizerType::HtmlEscape,
        SanitizerType::SqlEscape,
        SanitizerType::CryptoHash}) {
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 1.0),
        TaintLevel::Untainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.8),
        TaintLevel::Untainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.6),
        TaintLevel::Tainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.5),
        TaintLevel::Tainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.3),
        TaintLevel::Tainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.24),
        TaintLevel::HighlyTainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::Unknown, type, 0.9),
        TaintLevel::Untainted);
  }
}

TEST_F(TaintLevelTest, ApplySanitizerGradualRule) {
  for (auto type :
       {SanitizerType::InputValidation,
        SanitizerType::TypeConversion,
        SanitizerType::StringSanitize}) {
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 1.0),
        TaintLevel::PossiblyTainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::Unknown, type, 1.0),
        TaintLevel::Untainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.25),
        TaintLevel::Tainted);
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::HighlyTainted, type, 0.2),
        TaintLevel::HighlyTainted);
  }

  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::Tainted, SanitizerType::JsonParse, 0.9),
      TaintLevel::PossiblyTainted);
  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::Tainted, SanitizerType::JsonParse, 0.7),
      TaintLevel::Tainted);
}

TEST_F(TaintLevelTest, ApplySanitizerScenario) {
  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::HighlyTainted, SanitizerType::HtmlEscape, 1.0),
      TaintLevel::Untainted);

  // A weak escape lowers a single rank, it does not clean the value.
  auto weak = TaintLattice::apply_sanitizer(
      TaintLevel::HighlyTainted, SanitizerType::HtmlEscape, 0.3);
  EXPECT_EQ(weak, TaintLevel::Tainted);
  EXPECT_EQ(TaintLattice::height(weak), 3);
  EXPECT_FALSE(TaintLattice::is_bottom(weak));
}

TEST_F(TaintLevelTest, ApplySanitizerIsMonotonic) {
  const std::vector<double> effectivenesses = {
      -1.0,
      0.0,
      0.1,
      0.25,
      0.3,
      0.5,
      0.79,
      0.8,
      1.0,
      2.0,
      std::numeric_limits<double>::quiet_NaN(),
      std::numeric_limits<double>::infinity(),
  };

  for (auto level : test::all_levels()) {
    for (auto type : k_sanitizer_types) {
      for (auto effectiveness : effectivenesses) {
        auto sanitized =
            TaintLattice::apply_sanitizer(level, type, effectiveness);
        EXPECT_LE(TaintLattice::height(sanitized), TaintLattice::height(level));
      }
    }
  }

  // Untainted stays untainted.
  for (auto type : k_sanitizer_types) {
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(TaintLevel::Untainted, type),
        TaintLevel::Untainted);
  }
}

TEST_F(TaintLevelTest, ApplySanitizerClampsEffectiveness) {
  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::HighlyTainted, SanitizerType::HtmlEscape, 7.0),
      TaintLevel::Untainted);
  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::HighlyTainted, SanitizerType::HtmlEscape, -3.0),
      TaintLevel::HighlyTainted);
  EXPECT_EQ(
      TaintLattice::apply_sanitizer(
          TaintLevel::HighlyTainted,
          SanitizerType::HtmlEscape,
          std::numeric_limits<double>::quiet_NaN()),
      TaintLevel::HighlyTainted);
}

TEST_F(TaintLevelTest, ApplyUnknownSanitizerIsIdentity) {
  for (auto level : test::all_levels()) {
    EXPECT_EQ(
        TaintLattice::apply_sanitizer(
            level, static_cast<SanitizerType>(99), 1.0),
        level);
  }
}

TEST_F(TaintLevelTest, ToString) {
  EXPECT_EQ(TaintLattice::to_string(TaintLevel::Untainted), "UNTAINTED");
  EXPECT_EQ(TaintLattice::to_string(TaintLevel::Unknown), "UNKNOWN");
  EXPECT_EQ(
      TaintLattice::to_string(TaintLevel::PossiblyTainted), "POSSIBLY_TAINTED");
  EXPECT_EQ(TaintLattice::to_string(TaintLevel::Tainted), "TAINTED");
  EXPECT_EQ(
      TaintLattice::to_string(TaintLevel::HighlyTainted), "HIGHLY_TAINTED");
  EXPECT_EQ(TaintLattice::to_string(static_cast<TaintLevel>(17)), "UNKNOWN");
}

TEST_F(TaintLevelTest, FromString) {
  EXPECT_EQ(taint_level_from_string("UNTAINTED"), TaintLevel::Untainted);
  EXPECT_EQ(taint_level_from_string("sanitized"), TaintLevel::Untainted);
  EXPECT_EQ(taint_level_from_string("Clean"), TaintLevel::Untainted);
  EXPECT_EQ(
      taint_level_from_string("possibly-tainted"),
      TaintLevel::PossiblyTainted);
  EXPECT_EQ(taint_level_from_string("LIKELY_TAINTED"), TaintLevel::Tainted);
  EXPECT_EQ(
      taint_level_from_string("definitely-tainted"), TaintLevel::Tainted);
  EXPECT_EQ(
      taint_level_from_string("highly_tainted"), TaintLevel::HighlyTainted);
  EXPECT_EQ(taint_level_from_string("very-tainted"), std::nullopt);
  EXPECT_EQ(taint_level_from_string(""), std::nullopt);

  for (auto level : test::all_levels()) {
    EXPECT_EQ(
        taint_level_from_string(taint_level_to_json_string(level)), level);
    EXPECT_EQ(taint_level_from_string(TaintLattice::to_string(level)), level);
  }
}

TEST_F(TaintLevelTest, Compare) {
  EXPECT_EQ(
      compare_taint_levels(TaintLevel::Untainted, TaintLevel::Untainted), 0);
  EXPECT_LT(
      compare_taint_levels(TaintLevel::Unknown, TaintLevel::HighlyTainted), 0);
  EXPECT_GT(
      compare_taint_levels(TaintLevel::Tainted, TaintLevel::PossiblyTainted),
      0);
  EXPECT_EQ(
      compare_taint_levels(TaintLevel::LikelyTainted, TaintLevel::Tainted), 0);
}

} // namespace taintengine
