// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMON_CHECK_H_
#define HERALD_COMMON_CHECK_H_

#include "common/check_internal.h"

// Checks the given condition, and if it's false, prints an error and aborts.
//
// This is intended for checking invariants of the program and API misuse by
// callers, not for recoverable errors. Those are reported through `ErrorOr`.
//
// For example:
//   HERALD_CHECK(is_valid, "Data is not valid!");
//
// The condition must be parenthesized if it contains top-level commas, for
// example in a template argument list:
//   HERALD_CHECK((inst.IsOneOf<Call, TupleLiteral>()),
//                "Unexpected inst {0}", inst);
//
// Additional arguments are forwarded to `llvm::formatv` to build the message,
// and are only evaluated on failure.
#define HERALD_CHECK(condition, ...)                 \
  (__builtin_expect(static_cast<bool>(condition), 1)) \
      ? (void)0                                      \
      : HERALD_INTERNAL_CHECK_FAIL("CHECK", #condition __VA_OPT__(, ) __VA_ARGS__)

// This is similar to `HERALD_CHECK`, but is unconditional. Writing
// `HERALD_FATAL("message")` is clearer than `HERALD_CHECK(false, "message")`
// because it avoids confusion about control flow.
//
// For example:
//   HERALD_FATAL("Unreachable!");
#define HERALD_FATAL(...) HERALD_INTERNAL_CHECK_FAIL("FATAL", "", __VA_ARGS__)

#endif  // HERALD_COMMON_CHECK_H_
