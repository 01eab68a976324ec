// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_CONTEXT_H_
#define HERALD_COMMAND_COMMAND_CONTEXT_H_

#include <utility>

#include "common/check.h"
#include "llvm/ADT/Any.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

class Sender;

// A cursor over the whitespace-split tokens remaining in a command invocation.
// Tokens are not owned and must outlive the input.
class CommandInput {
 public:
  explicit CommandInput(llvm::ArrayRef<llvm::StringRef> tokens)
      : tokens_(tokens) {}

  auto empty() const -> bool { return tokens_.empty(); }

  // Returns the next token without consuming it.
  // REQUIRES: `!empty()`.
  auto Peek() const -> llvm::StringRef {
    HERALD_CHECK(!empty(), "No input remaining to peek.");
    return tokens_.front();
  }

  // Consumes and returns the next token.
  // REQUIRES: `!empty()`.
  auto Read() -> llvm::StringRef {
    HERALD_CHECK(!empty(), "No input remaining to read.");
    llvm::StringRef token = tokens_.front();
    tokens_ = tokens_.drop_front();
    return token;
  }

  auto remaining() const -> llvm::ArrayRef<llvm::StringRef> { return tokens_; }

 private:
  llvm::ArrayRef<llvm::StringRef> tokens_;
};

// Per-invocation state shared by the parsers and handlers of a command: the
// sender and the values parsed so far, keyed by component name.
class CommandContext {
 public:
  explicit CommandContext(const Sender& sender) : sender_(&sender) {}

  // Stores the parsed value for a component, replacing any earlier value.
  auto Store(llvm::StringRef name, llvm::Any value) -> void {
    values_[name] = std::move(value);
  }

  auto Contains(llvm::StringRef name) const -> bool {
    return values_.count(name) != 0;
  }

  // Returns the stored value for `name`, or null if it is absent or holds a
  // different type.
  template <typename T>
  auto Get(llvm::StringRef name) const -> const T* {
    auto it = values_.find(name);
    if (it == values_.end() || !llvm::any_isa<T>(it->second)) {
      return nullptr;
    }
    return llvm::any_cast<T>(&it->second);
  }

  auto sender() const -> const Sender& { return *sender_; }

 private:
  const Sender* sender_;
  llvm::StringMap<llvm::Any> values_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_CONTEXT_H_
