// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command_flag.h"

#include "common/check.h"
#include "llvm/ADT/StringExtras.h"

namespace Herald {

static auto IsValidFlagName(llvm::StringRef name) -> bool {
  if (name.empty()) {
    return false;
  }
  if (!llvm::isAlnum(name.front()) || !llvm::isAlnum(name.back())) {
    return false;
  }
  for (char c : name) {
    if (c != '-' && c != '_' && !llvm::isAlnum(c)) {
      return false;
    }
  }
  return true;
}

CommandFlag::CommandFlag(FlagInfo info)
    : name_(info.name.str()), description_(info.description.str()) {
  HERALD_CHECK(IsValidFlagName(info.name), "Invalid flag name: `{0}`",
               info.name);
  if (!info.short_name.empty()) {
    HERALD_CHECK(info.short_name.size() == 1 &&
                     llvm::isAlnum(info.short_name.front()),
                 "Invalid short name `{0}` for flag `--{1}`", info.short_name,
                 info.name);
    short_name_ = info.short_name.front();
  }
}

auto CommandFlag::Presence(FlagInfo info) -> CommandFlag {
  return CommandFlag(info);
}

auto CommandFlag::WithValue(FlagInfo info, ParserRef parser,
                            llvm::StringRef value_name) -> CommandFlag {
  HERALD_CHECK(parser != nullptr, "Value flag `--{0}` requires a parser.",
               info.name);
  CommandFlag flag(info);
  flag.parser_ = std::move(parser);
  flag.value_name_ = value_name.str();
  return flag;
}

}  // namespace Herald
