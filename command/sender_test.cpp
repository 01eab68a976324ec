// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/sender.h"

#include <gtest/gtest.h>

#include <string>

#include "command/command_test_helpers.h"

namespace Herald {
namespace {

using ::Herald::Testing::FakeSender;

constexpr SenderType AnySender("sender");
constexpr SenderType PlayerSender("player", &AnySender);
constexpr SenderType OperatorSender("operator", &PlayerSender);
constexpr SenderType ConsoleSender("console", &AnySender);

TEST(SenderTypeTest, IsA) {
  EXPECT_TRUE(AnySender.IsA(AnySender));
  EXPECT_TRUE(PlayerSender.IsA(AnySender));
  EXPECT_TRUE(OperatorSender.IsA(AnySender));
  EXPECT_TRUE(OperatorSender.IsA(PlayerSender));
  EXPECT_FALSE(AnySender.IsA(PlayerSender));
  EXPECT_FALSE(ConsoleSender.IsA(PlayerSender));
  EXPECT_FALSE(PlayerSender.IsA(ConsoleSender));
}

TEST(SenderTypeTest, IdentityIsByAddress) {
  SenderType other_player("player", &AnySender);
  EXPECT_FALSE(other_player.IsA(PlayerSender));
  EXPECT_TRUE(other_player.IsA(AnySender));
}

TEST(SenderTypeTest, Print) {
  std::string str;
  llvm::raw_string_ostream out(str);
  out << OperatorSender;
  EXPECT_EQ(out.str(), "operator");
  EXPECT_EQ(OperatorSender.parent(), &PlayerSender);
  EXPECT_EQ(AnySender.parent(), nullptr);
}

TEST(SenderTest, FakeSender) {
  FakeSender sender(PlayerSender, {"world.build"});
  EXPECT_EQ(&sender.sender_type(), &PlayerSender);
  EXPECT_TRUE(sender.HasPermission("world.build"));
  EXPECT_FALSE(sender.HasPermission("world.destroy"));
}

}  // namespace
}  // namespace Herald
