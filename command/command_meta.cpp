// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command_meta.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/SmallVector.h"

namespace Herald {

auto CommandMeta::Print(llvm::raw_ostream& out) const -> void {
  llvm::SmallVector<llvm::StringRef> keys;
  for (const auto& entry : values_) {
    keys.push_back(entry.getKey());
  }
  llvm::sort(keys);

  out << "{";
  llvm::ListSeparator sep;
  for (llvm::StringRef key : keys) {
    out << sep << key << "=";
    std::visit(
        [&](const auto& value) {
          if constexpr (std::is_same_v<std::decay_t<decltype(value)>, bool>) {
            out << (value ? "true" : "false");
          } else {
            out << value;
          }
        },
        values_.find(key)->second);
  }
  out << "}";
}

}  // namespace Herald
