// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_SENDER_H_
#define HERALD_COMMAND_SENDER_H_

#include "common/ostream.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// Identifies a category of command sender, such as a console or a player.
//
// Sender types form a tree: a type may name a parent, and a sender of a type is
// also a sender of each of its ancestors. Identity is by address, so types are
// typically declared once as static constants and referenced by pointer:
//
//   constexpr SenderType AnySender("sender");
//   constexpr SenderType PlayerSender("player", &AnySender);
class SenderType : public Printable<SenderType> {
 public:
  // `parent`, when provided, must outlive this type.
  explicit constexpr SenderType(llvm::StringRef name,
                                const SenderType* parent = nullptr)
      : name_(name), parent_(parent) {}

  // Copies would have a distinct identity.
  SenderType(const SenderType&) = delete;
  auto operator=(const SenderType&) -> SenderType& = delete;

  // Returns true if this type is `base` or one of its descendants.
  auto IsA(const SenderType& base) const -> bool;

  auto Print(llvm::raw_ostream& out) const -> void { out << name_; }

  auto name() const -> llvm::StringRef { return name_; }
  auto parent() const -> const SenderType* { return parent_; }

 private:
  llvm::StringRef name_;
  const SenderType* parent_;
};

// A sender identity as seen by permission evaluation and the dispatcher. Hosts
// implement this for their own sender objects.
class Sender {
 public:
  virtual ~Sender() = default;

  // The most specific type of this sender.
  virtual auto sender_type() const -> const SenderType& = 0;

  // Returns true if the sender has been granted the permission node
  // `permission`. What granting means is up to the host.
  virtual auto HasPermission(llvm::StringRef permission) const -> bool = 0;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_SENDER_H_
