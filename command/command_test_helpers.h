// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_TEST_HELPERS_H_
#define HERALD_COMMAND_COMMAND_TEST_HELPERS_H_

#include <gmock/gmock.h>

#include <ostream>
#include <string>
#include <vector>

#include "command/argument_parser.h"
#include "command/command.h"
#include "command/sender.h"
#include "common/error.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald::Testing {

// Reads one token as a `std::string`.
class StringParser : public ArgumentParser {
 public:
  auto value_type() const -> ValueType override {
    return ValueType::Of<std::string>();
  }

  auto Parse(CommandContext& /*context*/, CommandInput& input) const
      -> ErrorOr<llvm::Any> override {
    if (input.empty()) {
      return Error("expected a string");
    }
    return llvm::Any(input.Read().str());
  }
};

// Reads one token as a decimal `int`.
class IntParser : public ArgumentParser {
 public:
  auto value_type() const -> ValueType override {
    return ValueType::Of<int>();
  }

  auto Parse(CommandContext& /*context*/, CommandInput& input) const
      -> ErrorOr<llvm::Any> override {
    if (input.empty()) {
      return Error("expected an integer");
    }
    llvm::StringRef token = input.Read();
    int value;
    if (token.getAsInteger(/*Radix=*/10, value)) {
      return Error(llvm::formatv("`{0}` is not an integer", token).str());
    }
    return llvm::Any(value);
  }
};

// A registry holding parsers registered by type.
class FakeParserRegistry : public ParserRegistry {
 public:
  template <typename T>
  auto Register(ParserRef parser) -> FakeParserRegistry& {
    parsers_[ValueType::Of<T>().name()] = std::move(parser);
    return *this;
  }

  auto ParserFor(ValueType type) const -> ParserRef override {
    auto it = parsers_.find(type.name());
    return it == parsers_.end() ? nullptr : it->second;
  }

 private:
  llvm::StringMap<ParserRef> parsers_;
};

// A sender of a fixed type holding a fixed set of permissions.
class FakeSender : public Sender {
 public:
  explicit FakeSender(const SenderType& type,
                      llvm::ArrayRef<llvm::StringRef> permissions = {})
      : type_(&type) {
    for (llvm::StringRef permission : permissions) {
      permissions_.push_back(permission.str());
    }
  }

  auto sender_type() const -> const SenderType& override { return *type_; }

  auto HasPermission(llvm::StringRef permission) const -> bool override {
    return llvm::is_contained(permissions_, permission);
  }

 private:
  const SenderType* type_;
  llvm::SmallVector<std::string> permissions_;
};

// Matches a `CommandError` of a given kind in `ErrorOr<T, CommandError>`, with
// a message matching `matcher`.
class IsCommandError {
 public:
  // NOLINTNEXTLINE(readability-identifier-naming)
  using is_gtest_matcher = void;

  IsCommandError(CommandErrorKind kind, ::testing::Matcher<std::string> matcher)
      : kind_(kind), matcher_(std::move(matcher)) {}

  template <typename T>
  auto MatchAndExplain(const ErrorOr<T, CommandError>& result,
                       ::testing::MatchResultListener* listener) const -> bool {
    if (result.ok()) {
      *listener << "is a success";
      return false;
    }
    if (result.error().kind() != kind_) {
      *listener << "is a " << result.error();
      return false;
    }
    return matcher_.MatchAndExplain(result.error().message(), listener);
  }

  auto DescribeTo(std::ostream* os) const -> void {
    *os << "is a " << KindName() << " error and matches ";
    matcher_.DescribeTo(os);
  }

  auto DescribeNegationTo(std::ostream* os) const -> void {
    *os << "is not a " << KindName() << " error or does not match ";
    matcher_.DescribeTo(os);
  }

 private:
  auto KindName() const -> const char* {
    return kind_ == CommandErrorKind::Construction ? "construction" : "usage";
  }

  CommandErrorKind kind_;
  ::testing::Matcher<std::string> matcher_;
};

inline auto IsConstructionError(::testing::Matcher<std::string> matcher)
    -> IsCommandError {
  return IsCommandError(CommandErrorKind::Construction, std::move(matcher));
}

inline auto IsUsageError(::testing::Matcher<std::string> matcher)
    -> IsCommandError {
  return IsCommandError(CommandErrorKind::Usage, std::move(matcher));
}

// Returns the names of `components`, for matching with container matchers.
inline auto ComponentNames(llvm::ArrayRef<Component> components)
    -> std::vector<std::string> {
  std::vector<std::string> names;
  for (const Component& component : components) {
    names.push_back(component.name().str());
  }
  return names;
}

}  // namespace Herald::Testing

#endif  // HERALD_COMMAND_COMMAND_TEST_HELPERS_H_
