// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMON_ERROR_TEST_HELPERS_H_
#define HERALD_COMMON_ERROR_TEST_HELPERS_H_

#include <gmock/gmock.h>

#include <ostream>
#include <string>

#include "common/error.h"

namespace Herald::Testing {

// Matches the message for an error state of `ErrorOr<T, ErrorT>`. For example:
//   EXPECT_THAT(my_result, IsError(StrEq("error message")));
class IsError {
 public:
  // NOLINTNEXTLINE(readability-identifier-naming)
  using is_gtest_matcher = void;

  explicit IsError(::testing::Matcher<std::string> matcher)
      : matcher_(std::move(matcher)) {}

  template <typename T, typename ErrorT>
  auto MatchAndExplain(const ErrorOr<T, ErrorT>& result,
                       ::testing::MatchResultListener* listener) const -> bool {
    if (result.ok()) {
      *listener << "is a success";
      return false;
    }
    return matcher_.MatchAndExplain(result.error().message(), listener);
  }

  auto DescribeTo(std::ostream* os) const -> void {
    *os << "is an error and matches ";
    matcher_.DescribeTo(os);
  }

  auto DescribeNegationTo(std::ostream* os) const -> void {
    *os << "is a success or does not match ";
    matcher_.DescribeTo(os);
  }

 private:
  ::testing::Matcher<std::string> matcher_;
};

// Matches the value for a non-error state of `ErrorOr<T, ErrorT>`. For
// example:
//   EXPECT_THAT(my_result, IsSuccess(Eq(3)));
template <typename InnerMatcher>
class IsSuccessMatcher {
 public:
  // NOLINTNEXTLINE(readability-identifier-naming)
  using is_gtest_matcher = void;

  explicit IsSuccessMatcher(InnerMatcher matcher)
      : matcher_(std::move(matcher)) {}

  template <typename T, typename ErrorT>
  auto MatchAndExplain(const ErrorOr<T, ErrorT>& result,
                       ::testing::MatchResultListener* listener) const -> bool {
    if (!result.ok()) {
      *listener << "is an error with `" << result.error().message()
                          << "`";
      return false;
    }
    using ValueT = typename ErrorOr<T, ErrorT>::ValueT;
    return ::testing::SafeMatcherCast<const ValueT&>(matcher_)
        .MatchAndExplain(*result, listener);
  }

  // The inner matcher may be polymorphic, so it can only be described once a
  // value type is known; these descriptions stay generic.
  auto DescribeTo(std::ostream* os) const -> void {
    *os << "is a success and matches the value matcher";
  }

  auto DescribeNegationTo(std::ostream* os) const -> void {
    *os << "is an error or does not match the value matcher";
  }

 private:
  InnerMatcher matcher_;
};

// Wraps `IsSuccessMatcher` for the inner matcher deduction.
template <typename InnerMatcher>
auto IsSuccess(InnerMatcher matcher) -> IsSuccessMatcher<InnerMatcher> {
  return IsSuccessMatcher<InnerMatcher>(matcher);
}

}  // namespace Herald::Testing

namespace Herald {

// Supports printing `ErrorOr<T, ErrorT>` to `std::ostream` in tests. Values
// without a stream operator are elided.
template <typename T, typename ErrorT>
auto operator<<(std::ostream& out, const ErrorOr<T, ErrorT>& error_or)
    -> std::ostream& {
  using ValueT = typename ErrorOr<T, ErrorT>::ValueT;
  if (!error_or.ok()) {
    return out << "ErrorOr{.error = \"" << error_or.error().message() << "\"}";
  }
  if constexpr (requires(std::ostream& os, const ValueT& value) {
                  os << value;
                }) {
    return out << "ErrorOr{.value = `" << *error_or << "`}";
  } else {
    return out << "ErrorOr{.value = <unprintable>}";
  }
}

}  // namespace Herald

#endif  // HERALD_COMMON_ERROR_TEST_HELPERS_H_
