// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_H_
#define HERALD_COMMAND_COMMAND_H_

#include <optional>
#include <string>

#include "command/command_meta.h"
#include "command/component.h"
#include "command/execution_handler.h"
#include "command/permission.h"
#include "command/sender.h"
#include "common/error.h"
#include "common/ostream.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"

namespace Herald {

class FlagParser;

enum class CommandErrorKind {
  // The components of a command do not form a valid grammar.
  Construction,
  // An operation was called without the context it requires.
  Usage,
};

// An error defining a command.
class CommandError : public ErrorBase<CommandError> {
 public:
  static auto Construction(std::string message) -> CommandError {
    return CommandError(CommandErrorKind::Construction, std::move(message));
  }

  static auto Usage(std::string message) -> CommandError {
    return CommandError(CommandErrorKind::Usage, std::move(message));
  }

  auto Print(llvm::raw_ostream& out) const -> void;

  auto kind() const -> CommandErrorKind { return kind_; }
  auto message() const -> const std::string& { return message_; }

 private:
  CommandError(CommandErrorKind kind, std::string message)
      : kind_(kind), message_(std::move(message)) {}

  CommandErrorKind kind_;
  std::string message_;
};

// A validated, immutable command definition: an ordered grammar of components
// with a handler, an optional sender type bound, a permission and metadata.
//
// Commands are made by `CommandBuilder::Build`. The first component is the
// command's root, typically a literal naming it.
class Command : public Printable<Command> {
 public:
  // Validates and makes a command. Fails if `components` is empty, a component
  // has an empty name, or a required component follows an optional one.
  //
  // `sender_type`, when provided, must outlive the command.
  static auto Make(ComponentList components, ExecutionHandler handler,
                   const SenderType* sender_type, Permission permission,
                   CommandMeta meta)
      -> ErrorOr<Command, CommandError>;

  // Prints the component names separated by spaces.
  auto Print(llvm::raw_ostream& out) const -> void;

  // Returns true if the `hidden` meta key is set.
  auto IsHidden() const -> bool;

  // Returns true if `sender` satisfies the sender type bound, if any. The
  // permission is evaluated separately.
  auto AcceptsSender(const Sender& sender) const -> bool;

  auto components() const -> llvm::ArrayRef<Component> { return components_; }
  auto root_component() const -> const Component& {
    return components_.front();
  }

  // Returns a copy of the components without the flag component.
  auto non_flag_components() const -> ComponentList;

  // Returns the first flag component, or null if there is none.
  auto flag_component() const -> const Component*;

  // Returns the parser of the flag component, or null if there is none.
  auto flag_parser() const -> const FlagParser*;

  auto handler() const -> const ExecutionHandler& { return handler_; }
  // Null when any sender type is accepted.
  auto sender_type() const -> const SenderType* { return sender_type_; }
  auto permission() const -> const Permission& { return permission_; }
  auto meta() const -> const CommandMeta& { return meta_; }

 private:
  Command(ComponentList components, ExecutionHandler handler,
          const SenderType* sender_type, Permission permission,
          CommandMeta meta);

  ComponentList components_;
  ExecutionHandler handler_;
  const SenderType* sender_type_;
  Permission permission_;
  CommandMeta meta_;
  // The position of the first flag component in `components_`.
  std::optional<int> flag_index_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_H_
