// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_DEFAULT_VALUE_H_
#define HERALD_COMMAND_DEFAULT_VALUE_H_

#include <functional>
#include <string>
#include <utility>

#include "command/argument_parser.h"
#include "command/command_context.h"
#include "common/check.h"
#include "common/error.h"
#include "common/ostream.h"
#include "llvm/ADT/Any.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// The value an optional component takes when the input omits it.
class DefaultValue : public Printable<DefaultValue> {
 public:
  enum class Kind {
    // A fixed value.
    Constant,
    // Text run through the component's parser, as if the user had typed it.
    Parsed,
    // A value computed from the invocation context.
    Dynamic,
  };

  using Supplier = std::function<auto(const CommandContext&)->llvm::Any>;

  template <typename T>
  static auto Constant(T value) -> DefaultValue {
    return DefaultValue(Kind::Constant, llvm::Any(std::move(value)), "",
                        nullptr);
  }

  static auto Parsed(llvm::StringRef text) -> DefaultValue {
    return DefaultValue(Kind::Parsed, llvm::Any(), text.str(), nullptr);
  }

  static auto Dynamic(Supplier supplier) -> DefaultValue {
    HERALD_CHECK(supplier != nullptr,
                 "Dynamic default value has no supplier.");
    return DefaultValue(Kind::Dynamic, llvm::Any(), "", std::move(supplier));
  }

  // Produces the default for one invocation. `parser` is the owning
  // component's parser, and is only used for `Parsed` defaults.
  auto Evaluate(CommandContext& context, const ArgumentParser* parser) const
      -> ErrorOr<llvm::Any>;

  // Prints the parsed text, or a placeholder for non-textual defaults.
  auto Print(llvm::raw_ostream& out) const -> void;

  auto kind() const -> Kind { return kind_; }

  // The unparsed text of a `Parsed` default; empty otherwise.
  auto text() const -> llvm::StringRef { return text_; }

 private:
  DefaultValue(Kind kind, llvm::Any constant, std::string text,
               Supplier supplier)
      : kind_(kind),
        constant_(std::move(constant)),
        text_(std::move(text)),
        supplier_(std::move(supplier)) {}

  Kind kind_;
  llvm::Any constant_;
  std::string text_;
  Supplier supplier_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_DEFAULT_VALUE_H_
