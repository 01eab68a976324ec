// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "common/check.h"

#include <gtest/gtest.h>

#include <string>

namespace Herald {
namespace {

// Non-constexpr functions that always return true and false, to bypass constant
// condition checking.
auto AlwaysTrue() -> bool { return true; }
auto AlwaysFalse() -> bool { return false; }

TEST(CheckTest, CheckTrue) { HERALD_CHECK(AlwaysTrue()); }

TEST(CheckTest, CheckFalse) {
  ASSERT_DEATH({ HERALD_CHECK(AlwaysFalse()); },
               "CHECK failure at .*common/check_test.cpp:[0-9]+: "
               "AlwaysFalse\\(\\)\n");
}

TEST(CheckTest, CheckTrueMessageNotEvaluated) {
  bool called = false;
  auto callback = [&]() {
    called = true;
    return "called";
  };
  HERALD_CHECK(AlwaysTrue(), "{0}", callback());
  EXPECT_FALSE(called);
}

TEST(CheckTest, CheckFalseMessage) {
  ASSERT_DEATH({ HERALD_CHECK(AlwaysFalse(), "msg"); },
               "CHECK failure at .*common/check_test.cpp:[0-9]+: "
               "AlwaysFalse\\(\\): msg\n");
}

TEST(CheckTest, CheckFalseFormattedMessage) {
  const char msg[] = "msg";
  std::string str = "str";
  int i = 1;
  ASSERT_DEATH(
      { HERALD_CHECK(AlwaysFalse(), "{0} {1} {2} {3}", msg, str, i, 0); },
      "CHECK failure at .*common/check_test.cpp:[0-9]+: "
      "AlwaysFalse\\(\\): msg str 1 0\n");
}

TEST(CheckTest, CheckMessageWithBraces) {
  // Without format arguments, the message is printed verbatim.
  ASSERT_DEATH({ HERALD_CHECK(AlwaysFalse(), "expected {name}"); },
               "AlwaysFalse\\(\\): expected \\{name\\}\n");
}

TEST(CheckTest, Fatal) {
  ASSERT_DEATH({ HERALD_FATAL("msg"); },
               "FATAL failure at .*common/check_test.cpp:[0-9]+: msg\n");
}

TEST(CheckTest, FatalFormattedMessage) {
  ASSERT_DEATH({ HERALD_FATAL("bad component `{0}`", "name"); },
               "FATAL failure at .*: bad component `name`\n");
}

auto FatalNoReturnRequired() -> int { HERALD_FATAL("msg"); }

TEST(CheckTest, FatalNoReturnRequired) {
  ASSERT_DEATH({ FatalNoReturnRequired(); },
               "FATAL failure at .*common/check_test.cpp:[0-9]+: msg\n");
}

}  // namespace
}  // namespace Herald
