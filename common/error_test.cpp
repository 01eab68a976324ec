// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "common/error.h"

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "common/error_test_helpers.h"

namespace Herald {
namespace {

using ::Herald::Testing::IsError;
using ::Herald::Testing::IsSuccess;
using ::testing::Eq;
using ::testing::HasSubstr;

TEST(ErrorTest, Error) {
  Error err("test");
  EXPECT_EQ(err.message(), "test");
  EXPECT_EQ(err.location(), "");
}

TEST(ErrorTest, ErrorEmptyString) {
  ASSERT_DEATH({ Error err(""); }, "CHECK failure at");
}

auto IndirectError() -> Error { return Error("test"); }

TEST(ErrorTest, IndirectError) { EXPECT_EQ(IndirectError().message(), "test"); }

TEST(ErrorTest, ErrorOr) {
  ErrorOr<int> err(Error("test"));
  EXPECT_THAT(err, IsError("test"));
}

TEST(ErrorTest, ErrorOrValue) { EXPECT_TRUE(ErrorOr<int>(0).ok()); }

auto IndirectErrorOrTest() -> ErrorOr<int> { return Error("test"); }

TEST(ErrorTest, IndirectErrorOr) { EXPECT_FALSE(IndirectErrorOrTest().ok()); }

struct Val {
  int val;
};

TEST(ErrorTest, ErrorOrArrowOp) {
  ErrorOr<Val> err({1});
  EXPECT_EQ(err->val, 1);
}

TEST(ErrorTest, ErrorOrReference) {
  Val val = {1};
  ErrorOr<Val&> maybe_val(val);
  EXPECT_EQ(maybe_val->val, 1);
  val.val = 2;
  EXPECT_EQ(maybe_val->val, 2);
}

TEST(ErrorTest, ErrorOrMoveOnlyValue) {
  ErrorOr<std::unique_ptr<int>> result(std::make_unique<int>(3));
  std::unique_ptr<int> value = *std::move(result);
  EXPECT_EQ(*value, 3);
}

TEST(ErrorTest, ErrorOrWrongStateDies) {
  ErrorOr<int> err(Error("test"));
  ASSERT_DEATH({ (void)*err; }, "CHECK failure at .*: ok\\(\\)");
}

auto IndirectErrorOrSuccessTest() -> ErrorOr<Success> { return Success(); }

TEST(ErrorTest, IndirectErrorOrSuccess) {
  EXPECT_TRUE(IndirectErrorOrSuccessTest().ok());
}

TEST(ErrorTest, ReturnIfErrorNoError) {
  auto result = []() -> ErrorOr<Success> {
    HERALD_RETURN_IF_ERROR(ErrorOr<Success>(Success()));
    HERALD_RETURN_IF_ERROR(ErrorOr<Success>(Success()));
    return Success();
  }();
  EXPECT_TRUE(result.ok());
}

TEST(ErrorTest, ReturnIfErrorHasError) {
  auto result = []() -> ErrorOr<Success> {
    HERALD_RETURN_IF_ERROR(ErrorOr<Success>(Success()));
    HERALD_RETURN_IF_ERROR(ErrorOr<Success>(Error("error")));
    return Success();
  }();
  EXPECT_THAT(result, IsError("error"));
}

TEST(ErrorTest, AssignOrReturnNoError) {
  auto result = []() -> ErrorOr<int> {
    HERALD_ASSIGN_OR_RETURN(int a, ErrorOr<int>(1));
    HERALD_ASSIGN_OR_RETURN(const int b, ErrorOr<int>(2));
    int c = 0;
    HERALD_ASSIGN_OR_RETURN(c, ErrorOr<int>(3));
    return a + b + c;
  }();
  EXPECT_THAT(result, IsSuccess(Eq(6)));
}

TEST(ErrorTest, AssignOrReturnHasErrorInExpected) {
  auto result = []() -> ErrorOr<int> {
    HERALD_ASSIGN_OR_RETURN(int a, ErrorOr<int>(Error("error")));
    return a;
  }();
  EXPECT_THAT(result, IsError("error"));
}

TEST(ErrorTest, ErrorBuilderOperatorImplicitCast) {
  ErrorOr<int> result = ErrorBuilder() << "msg";
  EXPECT_THAT(result, IsError("msg"));
}

TEST(ErrorTest, ErrorBuilderAccumulates) {
  ErrorBuilder builder("parse");
  builder << "unknown flag `" << "--" << "verbose" << "` at " << 2;
  Error result = builder;
  EXPECT_EQ(result.location(), "parse");
  EXPECT_EQ(result.message(), "unknown flag `--verbose` at 2");
}

TEST(ErrorTest, StreamError) {
  Error result = ErrorBuilder("TestFunc") << "msg";
  std::string str;
  llvm::raw_string_ostream out(str);
  out << result;
  EXPECT_EQ(out.str(), "TestFunc: msg");
}

// An error type carrying a category alongside its message.
class TaggedError : public ErrorBase<TaggedError> {
 public:
  TaggedError(std::string tag, std::string message)
      : tag_(std::move(tag)), message_(std::move(message)) {}

  auto Print(llvm::raw_ostream& out) const -> void {
    out << "[" << tag_ << "] " << message_;
  }

  auto tag() const -> const std::string& { return tag_; }
  auto message() const -> const std::string& { return message_; }

 private:
  std::string tag_;
  std::string message_;
};

TEST(ErrorTest, CustomErrorType) {
  auto result = []() -> ErrorOr<int, TaggedError> {
    HERALD_RETURN_IF_ERROR(
        (ErrorOr<Success, TaggedError>(TaggedError("usage", "no registry"))));
    return 1;
  }();
  EXPECT_THAT(result, IsError(HasSubstr("registry")));
  EXPECT_EQ(result.error().tag(), "usage");

  std::string str;
  llvm::raw_string_ostream out(str);
  out << result.error();
  EXPECT_EQ(out.str(), "[usage] no registry");
}

TEST(ErrorTest, CustomErrorTypeSuccess) {
  ErrorOr<std::string, TaggedError> result(std::string("value"));
  EXPECT_THAT(result, IsSuccess(Eq("value")));
}

}  // namespace
}  // namespace Herald
