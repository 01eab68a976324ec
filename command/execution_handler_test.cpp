// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/execution_handler.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "command/command_test_helpers.h"

namespace Herald {
namespace {

using ::Herald::Testing::FakeSender;
using ::testing::ElementsAre;

constexpr SenderType ConsoleType("console");

class ExecutionHandlerTest : public ::testing::Test {
 protected:
  auto Record(std::string name) -> ExecutionHandler {
    return [this, name](CommandContext& /*context*/) { calls_.push_back(name); };
  }

  FakeSender sender_{ConsoleType};
  CommandContext context_{sender_};
  std::vector<std::string> calls_;
};

TEST_F(ExecutionHandlerTest, NoOp) {
  ExecutionHandler handler = NoOpHandler();
  ASSERT_TRUE(handler);
  handler(context_);
  EXPECT_TRUE(calls_.empty());
}

TEST_F(ExecutionHandlerTest, ComposeRunsInOrder) {
  ExecutionHandler handler =
      ComposeHandlers({Record("a"), Record("b"), Record("c")});
  handler(context_);
  EXPECT_THAT(calls_, ElementsAre("a", "b", "c"));
}

TEST_F(ExecutionHandlerTest, ComposeSkipsNull) {
  ExecutionHandler handler =
      ComposeHandlers({nullptr, Record("a"), ExecutionHandler()});
  handler(context_);
  handler(context_);
  EXPECT_THAT(calls_, ElementsAre("a", "a"));
}

TEST_F(ExecutionHandlerTest, HandlersShareContext) {
  ExecutionHandler handler = ComposeHandlers(
      {[](CommandContext& context) { context.Store("count", 1); },
       [this](CommandContext& context) {
         const int* count = context.Get<int>("count");
         calls_.push_back(count ? std::to_string(*count) : "missing");
       }});
  handler(context_);
  EXPECT_THAT(calls_, ElementsAre("1"));
}

}  // namespace
}  // namespace Herald
