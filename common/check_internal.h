// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMON_CHECK_INTERNAL_H_
#define HERALD_COMMON_CHECK_INTERNAL_H_

#include <string>
#include <utility>

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald::Internal {

// Implements the check failure message printing.
//
// This is out-of-line and will arrange to stop the program, print any
// debugging information and this string.
[[noreturn]] auto CheckFailImpl(const char* kind, const char* file, int line,
                                const char* condition_str,
                                llvm::StringRef extra_message) -> void;

// Formats the optional extra message and forwards to `CheckFailImpl`. With no
// format arguments, `format` is used verbatim so that messages containing
// braces don't need escaping.
template <typename... Ts>
[[noreturn, gnu::cold, gnu::noinline]] auto CheckFail(
    const char* kind, const char* file, int line, const char* condition_str,
    const char* format = "", Ts&&... values) -> void {
  if constexpr (sizeof...(Ts) == 0) {
    CheckFailImpl(kind, file, line, condition_str, format);
  } else {
    std::string message =
        llvm::formatv(format, std::forward<Ts>(values)...).str();
    CheckFailImpl(kind, file, line, condition_str, message);
  }
}

}  // namespace Herald::Internal

// Raw check failure, used by both `HERALD_CHECK` and `HERALD_FATAL`.
#define HERALD_INTERNAL_CHECK_FAIL(kind, condition_str, ...)              \
  ::Herald::Internal::CheckFail(kind, __FILE__, __LINE__, condition_str \
                                __VA_OPT__(, ) __VA_ARGS__)

#endif  // HERALD_COMMON_CHECK_INTERNAL_H_
