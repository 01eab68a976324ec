// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_FLAG_PARSER_H_
#define HERALD_COMMAND_FLAG_PARSER_H_

#include <array>
#include <optional>

#include "command/argument_parser.h"
#include "command/command_flag.h"
#include "common/error.h"
#include "llvm/ADT/Any.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// The flags found in one invocation, keyed by long name.
class FlagValues {
 public:
  auto IsPresent(llvm::StringRef name) const -> bool { return count(name) > 0; }

  // The number of times the flag was given.
  auto count(llvm::StringRef name) const -> int {
    auto it = entries_.find(name);
    return it == entries_.end() ? 0 : it->second.count;
  }

  // Returns the last value given for `name`, or null if there is none of type
  // `T`.
  template <typename T>
  auto Get(llvm::StringRef name) const -> const T* {
    auto it = entries_.find(name);
    if (it == entries_.end() || it->second.values.empty() ||
        !llvm::any_isa<T>(it->second.values.back())) {
      return nullptr;
    }
    return llvm::any_cast<T>(&it->second.values.back());
  }

  // Returns each value of type `T` given for `name`, in input order.
  template <typename T>
  auto GetAll(llvm::StringRef name) const -> llvm::SmallVector<T> {
    llvm::SmallVector<T> result;
    auto it = entries_.find(name);
    if (it == entries_.end()) {
      return result;
    }
    for (const llvm::Any& value : it->second.values) {
      if (llvm::any_isa<T>(value)) {
        result.push_back(*llvm::any_cast<T>(&value));
      }
    }
    return result;
  }

 private:
  friend class FlagParser;

  struct Entry {
    int count = 0;
    llvm::SmallVector<llvm::Any, 1> values;
  };

  llvm::StringMap<Entry> entries_;
};

// Parses every remaining token of the input as a flag from a fixed set,
// producing `FlagValues`. Recognized spellings are:
//
// - `--name` for any flag.
// - `--name=value` and `--name value` for value flags.
// - `-x`, `-x=value` and `-x value` using a flag's short name.
// - `-xyz` groups of short names. Only the last flag in a group may take a
//   value, and only from the following token.
class FlagParser : public ArgumentParser {
 public:
  // The flag names and short names must be unique.
  explicit FlagParser(llvm::ArrayRef<CommandFlag> flags);

  auto value_type() const -> ValueType override {
    return ValueType::Of<FlagValues>();
  }

  auto Parse(CommandContext& context, CommandInput& input) const
      -> ErrorOr<llvm::Any> override;

  auto flags() const -> llvm::ArrayRef<CommandFlag> { return flags_; }

  // Returns the flag with the long name `name`, or null.
  auto Lookup(llvm::StringRef name) const -> const CommandFlag*;

 private:
  auto LookupShort(char short_name) const -> const CommandFlag*;

  auto ParseLongFlag(llvm::StringRef token, CommandContext& context,
                     CommandInput& input, FlagValues& values) const
      -> ErrorOr<Success>;
  auto ParseShortFlagSeq(llvm::StringRef token, CommandContext& context,
                         CommandInput& input, FlagValues& values) const
      -> ErrorOr<Success>;

  // Records one occurrence of `flag`. `spelling` describes how it was
  // written for diagnostics. A value flag takes `value` when provided, and
  // otherwise reads its value from `input`.
  auto ParseFlag(const CommandFlag& flag, llvm::StringRef spelling,
                 std::optional<llvm::StringRef> value, CommandContext& context,
                 CommandInput& input, FlagValues& values) const
      -> ErrorOr<Success>;

  llvm::SmallVector<CommandFlag> flags_;
  // Indices into `flags_`.
  llvm::StringMap<int> by_name_;
  std::array<int, 128> by_short_name_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_FLAG_PARSER_H_
