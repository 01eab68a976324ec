// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMON_VLOG_H_
#define HERALD_COMMON_VLOG_H_

#include <utility>

#include "common/ostream.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald::Internal {

// Writes a formatted verbose log message to `out`, which must not be null.
template <typename... Ts>
[[gnu::noinline]] auto VLogImpl(llvm::raw_ostream* out, const char* format,
                                Ts&&... values) -> void {
  *out << llvm::formatv(format, std::forward<Ts>(values)...);
}

}  // namespace Herald::Internal

// Logs to `stream` when it is non-null, using `llvm::formatv` formatting. The
// format arguments are only evaluated when logging is enabled.
//
// For example:
//   HERALD_VLOG_TO(vlog_stream, "Building `{0}`\n", name);
#define HERALD_VLOG_TO(stream, ...)                  \
  __builtin_expect((stream) == nullptr, true)        \
      ? (void)0                                      \
      : ::Herald::Internal::VLogImpl((stream), __VA_ARGS__)

#endif  // HERALD_COMMON_VLOG_H_
