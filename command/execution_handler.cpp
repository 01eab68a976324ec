// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/execution_handler.h"

#include "llvm/ADT/SmallVector.h"

namespace Herald {

auto NoOpHandler() -> ExecutionHandler {
  return [](CommandContext& /*context*/) {};
}

auto ComposeHandlers(llvm::ArrayRef<ExecutionHandler> handlers)
    -> ExecutionHandler {
  llvm::SmallVector<ExecutionHandler> steps;
  for (const ExecutionHandler& handler : handlers) {
    if (handler) {
      steps.push_back(handler);
    }
  }
  return [steps = std::move(steps)](CommandContext& context) {
    for (const ExecutionHandler& step : steps) {
      step(context);
    }
  };
}

}  // namespace Herald
