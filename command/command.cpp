// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command.h"

#include "command/flag_parser.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald {

auto CommandError::Print(llvm::raw_ostream& out) const -> void {
  switch (kind_) {
    case CommandErrorKind::Construction:
      out << "construction error: ";
      break;
    case CommandErrorKind::Usage:
      out << "usage error: ";
      break;
  }
  out << message_;
}

auto Command::Make(ComponentList components, ExecutionHandler handler,
                   const SenderType* sender_type, Permission permission,
                   CommandMeta meta)
    -> ErrorOr<Command, CommandError> {
  if (components.empty()) {
    return CommandError::Construction(
        "at least one command component is required");
  }

  bool seen_optional = false;
  for (const Component& component : components) {
    if (component.name().empty()) {
      return CommandError::Construction("component names may not be empty");
    }
    if (!component.required()) {
      seen_optional = true;
    } else if (seen_optional) {
      return CommandError::Construction(
          llvm::formatv("command component `{0}` cannot be placed after an "
                        "optional component",
                        component.name())
              .str());
    }
  }

  return Command(std::move(components), std::move(handler), sender_type,
                 std::move(permission), std::move(meta));
}

Command::Command(ComponentList components, ExecutionHandler handler,
                 const SenderType* sender_type, Permission permission,
                 CommandMeta meta)
    : components_(std::move(components)),
      handler_(std::move(handler)),
      sender_type_(sender_type),
      permission_(std::move(permission)),
      meta_(std::move(meta)) {
  auto it = llvm::find_if(components_, [](const Component& component) {
    return component.is_flag();
  });
  if (it != components_.end()) {
    flag_index_ = static_cast<int>(it - components_.begin());
  }
}

auto Command::Print(llvm::raw_ostream& out) const -> void {
  llvm::ListSeparator sep(" ");
  for (const Component& component : components_) {
    out << sep << component.name();
  }
}

auto Command::IsHidden() const -> bool {
  return meta_.GetOrDefault(HiddenKey, false);
}

auto Command::AcceptsSender(const Sender& sender) const -> bool {
  return sender_type_ == nullptr || sender.sender_type().IsA(*sender_type_);
}

auto Command::non_flag_components() const -> ComponentList {
  ComponentList result;
  for (int i = 0; i < static_cast<int>(components_.size()); ++i) {
    if (i != flag_index_) {
      result.push_back(components_[i]);
    }
  }
  return result;
}

auto Command::flag_component() const -> const Component* {
  return flag_index_ ? &components_[*flag_index_] : nullptr;
}

auto Command::flag_parser() const -> const FlagParser* {
  const Component* component = flag_component();
  if (component == nullptr) {
    return nullptr;
  }
  // Flag components are only made by `Component::Flags`, which requires a
  // `FlagParser`.
  return static_cast<const FlagParser*>(component->parser().get());
}

}  // namespace Herald
