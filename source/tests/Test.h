/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <json/json.h>

#include <taint-engine/TaintLevel.h>

namespace taintengine {
namespace test {

class Test : public testing::Test {
 public:
  Test();
  virtual ~Test() = default;
};

/* Every canonical level, from bottom to top. */
const std::vector<TaintLevel>& all_levels();

Json::Value parse_json(std::string input);

/* Sort arrays recursively, for order-independent comparisons. */
Json::Value sorted_json(const Json::Value& value);

} // namespace test
} // namespace taintengine
