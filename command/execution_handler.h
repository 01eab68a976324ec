// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_EXECUTION_HANDLER_H_
#define HERALD_COMMAND_EXECUTION_HANDLER_H_

#include <functional>

#include "command/command_context.h"
#include "llvm/ADT/ArrayRef.h"

namespace Herald {

// The terminal behavior of a command, run by the dispatcher after the input
// has been parsed into the context.
using ExecutionHandler = std::function<auto(CommandContext&)->void>;

// A handler that does nothing.
auto NoOpHandler() -> ExecutionHandler;

// Returns a handler running each non-null handler of `handlers` in order.
auto ComposeHandlers(llvm::ArrayRef<ExecutionHandler> handlers)
    -> ExecutionHandler;

}  // namespace Herald

#endif  // HERALD_COMMAND_EXECUTION_HANDLER_H_
