// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_PERMISSION_H_
#define HERALD_COMMAND_PERMISSION_H_

#include <functional>
#include <string>
#include <vector>

#include "command/sender.h"
#include "common/ostream.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// The permission a sender needs in order to run a command. Evaluation belongs
// to the dispatcher; this only describes the requirement.
class Permission : public Printable<Permission> {
 public:
  enum class Kind {
    // No requirement.
    Empty,
    // A single permission node, checked with `Sender::HasPermission`.
    Simple,
    // An arbitrary check on the sender, identified by a key for display.
    Predicate,
    // Satisfied when any child is.
    AnyOf,
    // Satisfied when every child is.
    AllOf,
  };

  using PredicateFn = std::function<auto(const Sender&)->bool>;

  static auto Empty() -> Permission { return Permission(Kind::Empty, ""); }

  // A simple permission; an empty node is the empty permission.
  static auto Of(llvm::StringRef node) -> Permission {
    return node.empty() ? Empty() : Permission(Kind::Simple, node);
  }

  static auto Predicate(llvm::StringRef key, PredicateFn predicate)
      -> Permission;

  static auto AnyOf(llvm::ArrayRef<Permission> permissions) -> Permission;
  static auto AllOf(llvm::ArrayRef<Permission> permissions) -> Permission;

  // Returns true if `sender` satisfies the permission.
  auto Allows(const Sender& sender) const -> bool;

  // Prints the node for a simple permission, the key for a predicate, and
  // a parenthesized list for composites: `(a|b)` and `(a&b)`. The empty
  // permission prints nothing.
  auto Print(llvm::raw_ostream& out) const -> void;

  auto IsEmpty() const -> bool { return kind_ == Kind::Empty; }
  auto kind() const -> Kind { return kind_; }
  auto children() const -> llvm::ArrayRef<Permission> { return children_; }

 private:
  Permission(Kind kind, llvm::StringRef key) : kind_(kind), key_(key.str()) {}

  Kind kind_;
  // The node or predicate key; empty for other kinds.
  std::string key_;
  PredicateFn predicate_;
  std::vector<Permission> children_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_PERMISSION_H_
