// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/flag_parser.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "command/command_test_helpers.h"
#include "common/error_test_helpers.h"

namespace Herald {
namespace {

using ::Herald::Testing::FakeSender;
using ::Herald::Testing::IntParser;
using ::Herald::Testing::IsError;
using ::Herald::Testing::StringParser;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

constexpr SenderType ConsoleType("console");

class FlagParserTest : public ::testing::Test {
 protected:
  FlagParserTest()
      : parser_({
            CommandFlag::Presence({.name = "silent", .short_name = "s"}),
            CommandFlag::Presence({.name = "verbose", .short_name = "v"})
                .Repeatable(),
            CommandFlag::WithValue({.name = "delay", .short_name = "d"},
                                   std::make_shared<IntParser>(), "seconds"),
            CommandFlag::WithValue({.name = "name"},
                                   std::make_shared<StringParser>()),
            CommandFlag::WithValue({.name = "tag", .short_name = "t"},
                                   std::make_shared<StringParser>())
                .Repeatable(),
        }) {}

  // Parses `tokens`, which must all be consumed on success.
  auto Parse(llvm::ArrayRef<llvm::StringRef> tokens) -> ErrorOr<FlagValues> {
    CommandInput input(tokens);
    HERALD_ASSIGN_OR_RETURN(llvm::Any result, parser_.Parse(context_, input));
    EXPECT_TRUE(input.empty());
    if (!llvm::any_isa<FlagValues>(result)) {
      return Error("flag parser produced the wrong type");
    }
    return *llvm::any_cast<FlagValues>(&result);
  }

  FakeSender sender_{ConsoleType};
  CommandContext context_{sender_};
  FlagParser parser_;
};

TEST_F(FlagParserTest, ValueType) {
  EXPECT_EQ(parser_.value_type(), ValueType::Of<FlagValues>());
  EXPECT_EQ(parser_.flags().size(), 5u);
  ASSERT_NE(parser_.Lookup("delay"), nullptr);
  EXPECT_EQ(parser_.Lookup("delay")->short_name(), 'd');
  EXPECT_EQ(parser_.Lookup("missing"), nullptr);
}

TEST_F(FlagParserTest, Empty) {
  auto values = Parse({});
  ASSERT_TRUE(values.ok());
  EXPECT_FALSE(values->IsPresent("silent"));
  EXPECT_EQ(values->count("verbose"), 0);
  EXPECT_EQ(values->Get<int>("delay"), nullptr);
}

TEST_F(FlagParserTest, LongPresence) {
  auto values = Parse({"--silent"});
  ASSERT_TRUE(values.ok());
  EXPECT_TRUE(values->IsPresent("silent"));
  EXPECT_FALSE(values->IsPresent("verbose"));
}

TEST_F(FlagParserTest, ShortPresence) {
  auto values = Parse({"-s", "-v"});
  ASSERT_TRUE(values.ok());
  EXPECT_TRUE(values->IsPresent("silent"));
  EXPECT_TRUE(values->IsPresent("verbose"));
}

TEST_F(FlagParserTest, ShortGroup) {
  auto values = Parse({"-sv"});
  ASSERT_TRUE(values.ok());
  EXPECT_TRUE(values->IsPresent("silent"));
  EXPECT_TRUE(values->IsPresent("verbose"));
}

TEST_F(FlagParserTest, Repeatable) {
  auto values = Parse({"-vv", "--verbose"});
  ASSERT_TRUE(values.ok());
  EXPECT_EQ(values->count("verbose"), 3);
}

TEST_F(FlagParserTest, LongValueWithEquals) {
  auto values = Parse({"--delay=5"});
  ASSERT_TRUE(values.ok());
  ASSERT_NE(values->Get<int>("delay"), nullptr);
  EXPECT_EQ(*values->Get<int>("delay"), 5);
}

TEST_F(FlagParserTest, LongValueFromNextToken) {
  auto values = Parse({"--delay", "-5", "--silent"});
  ASSERT_TRUE(values.ok());
  ASSERT_NE(values->Get<int>("delay"), nullptr);
  EXPECT_EQ(*values->Get<int>("delay"), -5);
  EXPECT_TRUE(values->IsPresent("silent"));
}

TEST_F(FlagParserTest, ShortValue) {
  auto values = Parse({"-d=3", "-t", "red"});
  ASSERT_TRUE(values.ok());
  EXPECT_EQ(*values->Get<int>("delay"), 3);
  EXPECT_EQ(*values->Get<std::string>("tag"), "red");
}

TEST_F(FlagParserTest, ShortGroupEndingInValueFlag) {
  auto values = Parse({"-sd", "8"});
  ASSERT_TRUE(values.ok());
  EXPECT_TRUE(values->IsPresent("silent"));
  EXPECT_EQ(*values->Get<int>("delay"), 8);
}

TEST_F(FlagParserTest, RepeatedValues) {
  auto values = Parse({"--tag=a", "-t", "b", "--tag", "c"});
  ASSERT_TRUE(values.ok());
  EXPECT_EQ(values->count("tag"), 3);
  EXPECT_THAT(values->GetAll<std::string>("tag"), ElementsAre("a", "b", "c"));
  EXPECT_EQ(*values->Get<std::string>("tag"), "c");
  EXPECT_THAT(values->GetAll<int>("tag"), IsEmpty());
}

TEST_F(FlagParserTest, ValueOfWrongTypeIsNull) {
  auto values = Parse({"--name", "steve"});
  ASSERT_TRUE(values.ok());
  EXPECT_EQ(values->Get<int>("name"), nullptr);
  EXPECT_EQ(*values->Get<std::string>("name"), "steve");
}

TEST_F(FlagParserTest, UnknownLongFlag) {
  EXPECT_THAT(Parse({"--loud"}), IsError("unknown flag `--loud`"));
  EXPECT_THAT(Parse({"--loud=1"}), IsError("unknown flag `--loud`"));
}

TEST_F(FlagParserTest, UnknownShortFlag) {
  EXPECT_THAT(Parse({"-sx"}), IsError("unknown short flag `-x`"));
}

TEST_F(FlagParserTest, UnexpectedArgument) {
  EXPECT_THAT(Parse({"--silent", "loose"}),
              IsError("found unexpected argument `loose`; only flags may "
                      "follow"));
  EXPECT_THAT(Parse({"-"}),
              IsError("found unexpected argument `-`; only flags may follow"));
  EXPECT_THAT(Parse({"--"}),
              IsError("found unexpected argument `--`; only flags may follow"));
}

TEST_F(FlagParserTest, ValueOnPresenceFlag) {
  EXPECT_THAT(Parse({"--silent=yes"}),
              IsError("flag `--silent` cannot be used with a value, and `yes` "
                      "was provided"));
  EXPECT_THAT(Parse({"-s=yes"}),
              IsError("flag `-s` (short for `--silent`) cannot be used with a "
                      "value, and `yes` was provided"));
}

TEST_F(FlagParserTest, MissingValue) {
  EXPECT_THAT(Parse({"--delay"}),
              IsError("flag `--delay` requires a value to be provided and "
                      "none was"));
  EXPECT_THAT(Parse({"-sd"}),
              IsError("flag `-d` (short for `--delay`) requires a value to be "
                      "provided and none was"));
}

TEST_F(FlagParserTest, InvalidValue) {
  EXPECT_THAT(Parse({"--delay=soon"}), IsError("`soon` is not an integer"));
}

TEST_F(FlagParserTest, ValueOnGroup) {
  EXPECT_THAT(Parse({"-sv=1"}),
              IsError("cannot provide a value to the group of multiple short "
                      "flags `-sv=...`; values must be provided to a single "
                      "flag, using either the short or long spelling"));
}

TEST_F(FlagParserTest, ValueFlagInsideGroup) {
  EXPECT_THAT(Parse({"-ds", "1"}),
              IsError("flag `-d` (short for `--delay`) takes a value, so it "
                      "must be the last flag in the group `-ds`"));
}

TEST_F(FlagParserTest, NonRepeatableGivenTwice) {
  EXPECT_THAT(Parse({"--silent", "-s"}),
              IsError("flag `-s` (short for `--silent`) may only be provided "
                      "once"));
  EXPECT_THAT(Parse({"--delay=1", "--delay=2"}),
              IsError("flag `--delay` may only be provided once"));
}

TEST(FlagParserDeathTest, DuplicateNames) {
  ASSERT_DEATH(
      {
        FlagParser parser({CommandFlag::Presence({.name = "all"}),
                           CommandFlag::Presence({.name = "all"})});
      },
      "Duplicate flag name: `--all`");
  ASSERT_DEATH(
      {
        FlagParser parser(
            {CommandFlag::Presence({.name = "all", .short_name = "a"}),
             CommandFlag::Presence({.name = "any", .short_name = "a"})});
      },
      "Duplicate short flag name: `-a`");
}

TEST(CommandFlagDeathTest, InvalidNames) {
  ASSERT_DEATH({ CommandFlag::Presence({.name = "-all"}); },
               "Invalid flag name: `-all`");
  ASSERT_DEATH({ CommandFlag::Presence({.name = ""}); }, "Invalid flag name");
  ASSERT_DEATH({ CommandFlag::Presence({.name = "all", .short_name = "ab"}); },
               "Invalid short name `ab` for flag `--all`");
}

TEST(CommandFlagTest, Accessors) {
  CommandFlag flag =
      CommandFlag::WithValue({.name = "max-count",
                              .short_name = "m",
                              .description = "The most to take."},
                             std::make_shared<IntParser>(), "n");
  EXPECT_EQ(flag.name(), "max-count");
  EXPECT_EQ(flag.short_name(), 'm');
  EXPECT_EQ(flag.description(), "The most to take.");
  EXPECT_EQ(flag.value_name(), "n");
  EXPECT_TRUE(flag.has_value());
  EXPECT_FALSE(flag.repeatable());
  EXPECT_TRUE(flag.Repeatable().repeatable());

  std::string str;
  llvm::raw_string_ostream out(str);
  out << flag;
  EXPECT_EQ(out.str(), "--max-count");
}

}  // namespace
}  // namespace Herald
