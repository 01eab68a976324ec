// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_PRINTER_H_
#define HERALD_COMMAND_COMMAND_PRINTER_H_

#include "command/command.h"
#include "command/command_flag.h"
#include "command/component.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace Herald {

// Renders usage and help text for commands.
//
// Description text is printed as a lightweight Markdown block: blank lines
// separate paragraphs, lines within a paragraph are joined, and fenced or
// four-space indented blocks are kept verbatim.
class CommandPrinter {
 public:
  explicit CommandPrinter(llvm::raw_ostream& out) : out_(&out) {}

  // Prints a one-line synopsis, without a trailing newline. For example:
  //   teleport <target> [reason] [-s] [--delay=<seconds>]
  auto PrintUsage(const Command& command) const -> void;

  // Prints the root description, the usage line, and sections describing the
  // arguments, flags and permission of `command`.
  auto PrintHelp(const Command& command) const -> void;

  // Prints an indented usage line for each command that isn't hidden.
  auto PrintCommandList(llvm::ArrayRef<Command> commands) const -> void;

 private:
  // The indent for help text under an argument or flag.
  static constexpr llvm::StringLiteral BlockIndent = "          ";

  auto PrintComponentUsage(const Component& component) const -> void;
  auto PrintFlagUsage(const CommandFlag& flag) const -> void;
  auto PrintArgumentHelp(const Component& component) const -> void;
  auto PrintFlagHelp(const CommandFlag& flag) const -> void;
  auto PrintTextBlock(llvm::StringRef indent, llvm::StringRef text) const
      -> void;

  llvm::raw_ostream* out_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_PRINTER_H_
