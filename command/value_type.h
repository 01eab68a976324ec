// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_VALUE_TYPE_H_
#define HERALD_COMMAND_VALUE_TYPE_H_

#include "common/ostream.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/TypeName.h"

namespace Herald {

// A run-time tag for the C++ type of a parsed value. Tags compare by the
// compiler's spelling of the type, so they work without RTTI.
class ValueType : public Printable<ValueType> {
 public:
  // Returns the tag for `T`.
  template <typename T>
  static auto Of() -> ValueType {
    return ValueType(llvm::getTypeName<T>());
  }

  // Returns the tag used for components whose value has no meaningful type,
  // such as the synthesized flag component.
  static auto Untyped() -> ValueType { return ValueType(""); }

  auto Print(llvm::raw_ostream& out) const -> void {
    out << (is_untyped() ? "<untyped>" : name_);
  }

  auto name() const -> llvm::StringRef { return name_; }
  auto is_untyped() const -> bool { return name_.empty(); }

  friend auto operator==(ValueType lhs, ValueType rhs) -> bool {
    return lhs.name_ == rhs.name_;
  }
  friend auto operator!=(ValueType lhs, ValueType rhs) -> bool {
    return !(lhs == rhs);
  }

 private:
  explicit ValueType(llvm::StringRef name) : name_(name) {}

  // Points at static storage owned by the compiler's type name strings.
  llvm::StringRef name_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_VALUE_TYPE_H_
