// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_FLAG_H_
#define HERALD_COMMAND_COMMAND_FLAG_H_

#include <string>

#include "command/argument_parser.h"
#include "common/ostream.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// Naming information for a flag.
//
// This is designed to be used with designated initializers:
//   {.name = "silent", .short_name = "s", .description = "Suppress output."}
struct FlagInfo {
  // The long name, spelled `--name` in input. It must start and end with an
  // alphanumeric character, and may contain `-` and `_` in between.
  llvm::StringRef name;
  // An optional single alphanumeric character, spelled `-x` in input.
  llvm::StringRef short_name = "";
  llvm::StringRef description = "";
};

// A named option of a command. Flags are either present or absent, or carry a
// value read by their own parser.
class CommandFlag : public Printable<CommandFlag> {
 public:
  // A flag whose only value is its presence.
  static auto Presence(FlagInfo info) -> CommandFlag;

  // A flag taking a value parsed by `parser`. `value_name` is used in help
  // output, as in `--name=<value_name>`.
  static auto WithValue(FlagInfo info, ParserRef parser,
                        llvm::StringRef value_name = "value") -> CommandFlag;

  // Returns a copy of this flag that may be given more than once.
  auto Repeatable() const -> CommandFlag {
    CommandFlag copy = *this;
    copy.repeatable_ = true;
    return copy;
  }

  // Prints the long spelling.
  auto Print(llvm::raw_ostream& out) const -> void { out << "--" << name_; }

  auto name() const -> llvm::StringRef { return name_; }
  // Zero when the flag has no short spelling.
  auto short_name() const -> char { return short_name_; }
  auto description() const -> llvm::StringRef { return description_; }
  auto value_name() const -> llvm::StringRef { return value_name_; }
  auto repeatable() const -> bool { return repeatable_; }
  auto has_value() const -> bool { return parser_ != nullptr; }
  // Null for presence flags.
  auto parser() const -> const ParserRef& { return parser_; }

 private:
  explicit CommandFlag(FlagInfo info);

  std::string name_;
  char short_name_ = 0;
  std::string description_;
  std::string value_name_;
  ParserRef parser_;
  bool repeatable_ = false;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_FLAG_H_
