// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/sender.h"

namespace Herald {

auto SenderType::IsA(const SenderType& base) const -> bool {
  for (const SenderType* type = this; type != nullptr; type = type->parent_) {
    if (type == &base) {
      return true;
    }
  }
  return false;
}

}  // namespace Herald
