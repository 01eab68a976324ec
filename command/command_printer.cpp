// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command_printer.h"

#include "command/flag_parser.h"
#include "llvm/ADT/SmallVector.h"

namespace Herald {

auto CommandPrinter::PrintUsage(const Command& command) const -> void {
  llvm::StringRef space = "";
  for (const Component& component : command.non_flag_components()) {
    *out_ << space;
    PrintComponentUsage(component);
    space = " ";
  }
  if (const FlagParser* flags = command.flag_parser()) {
    for (const CommandFlag& flag : flags->flags()) {
      *out_ << space;
      PrintFlagUsage(flag);
      space = " ";
    }
  }
}

auto CommandPrinter::PrintComponentUsage(const Component& component) const
    -> void {
  switch (component.kind()) {
    case ComponentKind::Literal:
      *out_ << component.name();
      return;
    case ComponentKind::Argument:
      if (component.required()) {
        *out_ << "<" << component.name() << ">";
      } else {
        *out_ << "[" << component.name() << "]";
      }
      return;
    case ComponentKind::Flag:
      // A flag component other than the command's first. Its flags are not
      // parsed, so it is shown by name only.
      *out_ << "[" << component.name() << "...]";
      return;
  }
}

auto CommandPrinter::PrintFlagUsage(const CommandFlag& flag) const -> void {
  *out_ << "[";
  if (flag.short_name() != 0 && !flag.has_value()) {
    *out_ << "-" << flag.short_name();
  } else {
    *out_ << "--" << flag.name();
    if (flag.has_value()) {
      *out_ << "=<" << flag.value_name() << ">";
    }
  }
  *out_ << "]";
  if (flag.repeatable()) {
    *out_ << "...";
  }
}

auto CommandPrinter::PrintHelp(const Command& command) const -> void {
  llvm::StringRef description = command.root_component().description();
  if (!description.trim('\n').empty()) {
    PrintTextBlock("", description);
    *out_ << "\n";
  }

  *out_ << "Usage:\n  ";
  PrintUsage(command);
  *out_ << "\n";

  llvm::SmallVector<const Component*> arguments;
  for (const Component& component : command.components()) {
    if (component.kind() == ComponentKind::Argument) {
      arguments.push_back(&component);
    }
  }
  if (!arguments.empty()) {
    *out_ << "\nArguments:\n";
    for (const Component* argument : arguments) {
      PrintArgumentHelp(*argument);
    }
  }

  const FlagParser* flags = command.flag_parser();
  if (flags != nullptr && !flags->flags().empty()) {
    *out_ << "\nFlags:\n";
    for (const CommandFlag& flag : flags->flags()) {
      PrintFlagHelp(flag);
    }
  }

  if (!command.permission().IsEmpty()) {
    *out_ << "\nPermission: " << command.permission() << "\n";
  }
}

auto CommandPrinter::PrintArgumentHelp(const Component& component) const
    -> void {
  *out_ << "  ";
  PrintComponentUsage(component);
  *out_ << "\n";
  PrintTextBlock(BlockIndent, component.description());
  const auto& default_value = component.default_value();
  if (default_value && default_value->kind() == DefaultValue::Kind::Parsed) {
    *out_ << BlockIndent << "Default value: " << default_value->text() << "\n";
  }
}

auto CommandPrinter::PrintFlagHelp(const CommandFlag& flag) const -> void {
  if (flag.short_name() != 0) {
    *out_ << "  -" << flag.short_name() << ", ";
  } else {
    *out_ << "      ";
  }
  *out_ << "--" << flag.name();
  if (flag.has_value()) {
    *out_ << "=<" << flag.value_name() << ">";
  }
  *out_ << "\n";
  PrintTextBlock(BlockIndent, flag.description());
}

auto CommandPrinter::PrintCommandList(llvm::ArrayRef<Command> commands) const
    -> void {
  for (const Command& command : commands) {
    if (command.IsHidden()) {
      continue;
    }
    *out_ << "  ";
    PrintUsage(command);
    *out_ << "\n";
  }
}

auto CommandPrinter::PrintTextBlock(llvm::StringRef indent,
                                    llvm::StringRef text) const -> void {
  // Surrounding newlines are dropped so that raw string literals can be used.
  text = text.trim('\n');
  if (text.empty()) {
    return;
  }

  llvm::SmallVector<llvm::StringRef> lines;
  text.split(lines, "\n");

  for (int i = 0, size = lines.size(); i < size;) {
    if (lines[i].empty()) {
      *out_ << "\n";
      ++i;
      continue;
    }

    // Fenced blocks are printed verbatim through the closing fence.
    if (lines[i].startswith("```")) {
      llvm::StringRef fence =
          lines[i].slice(0, lines[i].find_first_not_of('`'));
      do {
        *out_ << indent << lines[i] << "\n";
        ++i;
      } while (i < size && !lines[i].startswith(fence));
      if (i < size) {
        *out_ << indent << lines[i] << "\n";
        ++i;
      }
      continue;
    }

    // So are indented blocks.
    if (lines[i].startswith("    ")) {
      do {
        *out_ << indent << lines[i] << "\n";
        ++i;
      } while (i < size && lines[i].startswith("    "));
      continue;
    }

    // Other lines up to the next blank line form a paragraph on one line.
    llvm::StringRef space = indent;
    do {
      *out_ << space << lines[i].trim();
      space = " ";
      ++i;
    } while (i < size && !lines[i].empty());
    *out_ << "\n";
  }
}

}  // namespace Herald
