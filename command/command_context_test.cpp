// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command_context.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

#include "command/command_test_helpers.h"

namespace Herald {
namespace {

using ::Herald::Testing::FakeSender;
using ::testing::ElementsAre;

constexpr SenderType ConsoleType("console");

TEST(CommandInputTest, ReadAndPeek) {
  llvm::StringRef tokens[] = {"give", "diamond", "64"};
  CommandInput input(tokens);
  EXPECT_FALSE(input.empty());
  EXPECT_EQ(input.Peek(), "give");
  EXPECT_EQ(input.Read(), "give");
  EXPECT_THAT(input.remaining(), ElementsAre("diamond", "64"));
  EXPECT_EQ(input.Read(), "diamond");
  EXPECT_EQ(input.Read(), "64");
  EXPECT_TRUE(input.empty());
}

TEST(CommandInputTest, ReadPastEndDies) {
  llvm::ArrayRef<llvm::StringRef> no_tokens;
  CommandInput input(no_tokens);
  ASSERT_DEATH({ input.Read(); }, "No input remaining to read");
}

TEST(CommandContextTest, StoreAndGet) {
  FakeSender sender(ConsoleType);
  CommandContext context(sender);
  EXPECT_EQ(&context.sender(), &sender);
  EXPECT_FALSE(context.Contains("amount"));

  context.Store("amount", 64);
  context.Store("item", std::string("diamond"));
  EXPECT_TRUE(context.Contains("amount"));
  ASSERT_NE(context.Get<int>("amount"), nullptr);
  EXPECT_EQ(*context.Get<int>("amount"), 64);
  ASSERT_NE(context.Get<std::string>("item"), nullptr);
  EXPECT_EQ(*context.Get<std::string>("item"), "diamond");
}

TEST(CommandContextTest, GetWithWrongTypeIsNull) {
  FakeSender sender(ConsoleType);
  CommandContext context(sender);
  context.Store("amount", 64);
  EXPECT_EQ(context.Get<std::string>("amount"), nullptr);
  EXPECT_EQ(context.Get<int>("missing"), nullptr);
}

TEST(CommandContextTest, StoreReplaces) {
  FakeSender sender(ConsoleType);
  CommandContext context(sender);
  context.Store("amount", 1);
  context.Store("amount", std::string("all"));
  EXPECT_EQ(context.Get<int>("amount"), nullptr);
  EXPECT_EQ(*context.Get<std::string>("amount"), "all");
}

}  // namespace
}  // namespace Herald
