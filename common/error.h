// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMON_ERROR_H_
#define HERALD_COMMON_ERROR_H_

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "common/check.h"
#include "common/ostream.h"
#include "llvm/Support/raw_ostream.h"

namespace Herald {

// Success values should be represented as the presence of a value in ErrorOr,
// using `ErrorOr<Success>` and `return Success();` if no value needs to be
// returned.
struct Success : public Printable<Success> {
  auto Print(llvm::raw_ostream& out) const -> void { out << "Success"; }
};

// Base class for custom error types used with `ErrorOr<T, ErrorT>`. Children
// must provide `message()` and `Print()`.
template <typename ErrorT>
class ErrorBase : public Printable<ErrorT> {
 protected:
  ErrorBase() = default;
};

// Tracks an error message, with an optional location.
class [[nodiscard]] Error : public ErrorBase<Error> {
 public:
  // Represents an error state.
  explicit Error(std::string location, std::string message)
      : location_(std::move(location)), message_(std::move(message)) {
    HERALD_CHECK(!message_.empty(), "Errors must have a message.");
  }

  // Represents an error with no associated location.
  explicit Error(std::string message) : Error("", std::move(message)) {}

  Error(Error&& other) noexcept = default;
  auto operator=(Error&& other) noexcept -> Error& = default;

  // Prints the error string.
  auto Print(llvm::raw_ostream& out) const -> void {
    if (!location().empty()) {
      out << location() << ": ";
    }
    out << message();
  }

  // Returns the error location, which may be empty.
  auto location() const -> const std::string& { return location_; }

  // Returns the error message.
  auto message() const -> const std::string& { return message_; }

 private:
  // The location associated with the error.
  std::string location_;
  // The error message.
  std::string message_;
};

// Holds a value of type `T`, or an `ErrorT` explaining why the value is
// unavailable.
template <typename T, typename ErrorT = Error>
class [[nodiscard]] ErrorOr {
 public:
  using ValueT = std::remove_reference_t<T>;

  // Constructs with an error; the error must not be Error::Success().
  // Implicit for easy construction on returns.
  // NOLINTNEXTLINE(google-explicit-constructor)
  ErrorOr(ErrorT err) : val_(std::in_place_index<0>, std::move(err)) {}

  // Constructs with a value.
  // Implicit for easy construction on returns.
  // NOLINTNEXTLINE(google-explicit-constructor)
  ErrorOr(T val) : val_(std::in_place_index<1>, static_cast<T&&>(val)) {}

  // Returns true for success.
  auto ok() const -> bool { return val_.index() == 1; }

  // Returns the contained error.
  // REQUIRES: `ok()` is false.
  auto error() const& -> const ErrorT& {
    HERALD_CHECK(!ok());
    return std::get<0>(val_);
  }
  auto error() && -> ErrorT {
    HERALD_CHECK(!ok());
    return std::get<0>(std::move(val_));
  }

  // Returns the contained value.
  // REQUIRES: `ok()` is true.
  auto operator*() & -> ValueT& {
    HERALD_CHECK(ok());
    return std::get<1>(val_);
  }

  // Returns the contained value.
  // REQUIRES: `ok()` is true.
  auto operator*() const& -> const ValueT& {
    HERALD_CHECK(ok());
    return std::get<1>(val_);
  }

  // Moves out the contained value.
  // REQUIRES: `ok()` is true.
  auto operator*() && -> ValueT&& {
    HERALD_CHECK(ok());
    ValueT& value = std::get<1>(val_);
    return std::move(value);
  }

  // Returns the contained value.
  // REQUIRES: `ok()` is true.
  auto operator->() -> ValueT* { return &**this; }

  // Returns the contained value.
  // REQUIRES: `ok()` is true.
  auto operator->() const -> const ValueT* { return &**this; }

 private:
  using StoredT = std::conditional_t<std::is_reference_v<T>,
                                     std::reference_wrapper<ValueT>, T>;

  // Either an error message or a value.
  std::variant<ErrorT, StoredT> val_;
};

// A helper class for accumulating error message and converting to
// `Error` and `ErrorOr<T>`.
class ErrorBuilder {
 public:
  explicit ErrorBuilder(std::string location = "")
      : location_(std::move(location)),
        message_(std::make_unique<std::string>()),
        out_(std::make_unique<llvm::raw_string_ostream>(*message_)) {}

  // Accumulates string message to a temporary `ErrorBuilder`. After streaming,
  // the builder must be converted to an `Error` or `ErrorOr`.
  template <typename T>
  auto operator<<(T&& message) && -> ErrorBuilder&& {
    *out_ << message;
    return std::move(*this);
  }

  // Accumulates string message for an lvalue error builder.
  template <typename T>
  auto operator<<(T&& message) & -> ErrorBuilder& {
    *out_ << message;
    return *this;
  }

  // NOLINTNEXTLINE(google-explicit-constructor): Implicit cast for returns.
  operator Error() { return Error(location_, TakeMessage()); }

  template <typename T>
  // NOLINTNEXTLINE(google-explicit-constructor): Implicit cast for returns.
  operator ErrorOr<T>() {
    return Error(location_, TakeMessage());
  }

 private:
  auto TakeMessage() -> std::string {
    std::string message = std::move(out_->str());
    message_->clear();
    return message;
  }

  std::string location_;
  // The stream writes into `message_`, so both are heap allocated to keep the
  // builder movable.
  std::unique_ptr<std::string> message_;
  std::unique_ptr<llvm::raw_string_ostream> out_;
};

}  // namespace Herald

// Macro hackery to get a unique variable name.
#define HERALD_MAKE_UNIQUE_NAME_IMPL(a, b, c) a##b##c
#define HERALD_MAKE_UNIQUE_NAME(a, b, c) HERALD_MAKE_UNIQUE_NAME_IMPL(a, b, c)

// Macro to prevent a top-level comma from being interpreted as a macro
// argument separator.
#define HERALD_PROTECT_COMMAS(...) __VA_ARGS__

#define HERALD_RETURN_IF_ERROR_IMPL(unique_name, expr)                  \
  if (auto unique_name = (expr); /* NOLINT(bugprone-macro-parentheses) */ \
      !(unique_name).ok()) {                                            \
    return std::move(unique_name).error();                              \
  }

// Returns an error from the enclosing function if `expr` is in an error state.
#define HERALD_RETURN_IF_ERROR(expr)                                    \
  HERALD_RETURN_IF_ERROR_IMPL(                                          \
      HERALD_MAKE_UNIQUE_NAME(_llvm_error_line, __LINE__, __COUNTER__), \
      HERALD_PROTECT_COMMAS(expr))

#define HERALD_ASSIGN_OR_RETURN_IMPL(unique_name, var, expr) \
  auto unique_name = (expr); /* NOLINT(bugprone-macro-parentheses) */ \
  if (!(unique_name).ok()) {                                 \
    return std::move(unique_name).error();                   \
  }                                                          \
  var = std::move(*(unique_name)); /* NOLINT(bugprone-macro-parentheses) */

// Assigns the value of `expr` to `var`, or returns the error from the
// enclosing function. `var` may be a declaration such as `int x`.
#define HERALD_ASSIGN_OR_RETURN(var, expr)                                 \
  HERALD_ASSIGN_OR_RETURN_IMPL(                                            \
      HERALD_MAKE_UNIQUE_NAME(_llvm_expected_line, __LINE__, __COUNTER__), \
      HERALD_PROTECT_COMMAS(var), HERALD_PROTECT_COMMAS(expr))

#endif  // HERALD_COMMON_ERROR_H_
