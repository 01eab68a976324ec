// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/permission.h"

#include "common/check.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"

namespace Herald {

auto Permission::Predicate(llvm::StringRef key, PredicateFn predicate)
    -> Permission {
  HERALD_CHECK(predicate, "Predicate permission `{0}` has no predicate.", key);
  Permission permission(Kind::Predicate, key);
  permission.predicate_ = std::move(predicate);
  return permission;
}

auto Permission::AnyOf(llvm::ArrayRef<Permission> permissions) -> Permission {
  Permission permission(Kind::AnyOf, "");
  permission.children_.assign(permissions.begin(), permissions.end());
  return permission;
}

auto Permission::AllOf(llvm::ArrayRef<Permission> permissions) -> Permission {
  Permission permission(Kind::AllOf, "");
  permission.children_.assign(permissions.begin(), permissions.end());
  return permission;
}

auto Permission::Allows(const Sender& sender) const -> bool {
  switch (kind_) {
    case Kind::Empty:
      return true;
    case Kind::Simple:
      return sender.HasPermission(key_);
    case Kind::Predicate:
      return predicate_(sender);
    case Kind::AnyOf:
      return llvm::any_of(children_, [&](const Permission& child) {
        return child.Allows(sender);
      });
    case Kind::AllOf:
      return llvm::all_of(children_, [&](const Permission& child) {
        return child.Allows(sender);
      });
  }
  HERALD_FATAL("Unknown permission kind.");
}

auto Permission::Print(llvm::raw_ostream& out) const -> void {
  switch (kind_) {
    case Kind::Empty:
      return;
    case Kind::Simple:
    case Kind::Predicate:
      out << key_;
      return;
    case Kind::AnyOf:
    case Kind::AllOf: {
      llvm::StringRef separator = kind_ == Kind::AnyOf ? "|" : "&";
      out << "(";
      llvm::ListSeparator sep(separator);
      for (const Permission& child : children_) {
        out << sep << child;
      }
      out << ")";
      return;
    }
  }
}

}  // namespace Herald
