// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMPONENT_H_
#define HERALD_COMMAND_COMPONENT_H_

#include <memory>
#include <optional>
#include <string>

#include "command/argument_parser.h"
#include "command/default_value.h"
#include "command/value_type.h"
#include "common/ostream.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

class FlagParser;

enum class ComponentKind {
  // Fixed text matched by name or alias.
  Literal,
  // A typed value read by a parser.
  Argument,
  // The aggregated flags of a command.
  Flag,
};

auto operator<<(llvm::raw_ostream& out, ComponentKind kind)
    -> llvm::raw_ostream&;

// Naming information for an argument component.
//
// This is designed to be used with designated initializers:
//   {.name = "target", .description = "The player to teleport."}
struct ComponentInfo {
  llvm::StringRef name;
  llvm::StringRef description = "";
};

// An atomic named unit of a command's grammar.
//
// Components are values: copying one copies its name, aliases and
// description, while its parser, suggestion provider and preprocessors are
// shared immutable collaborators. No validation happens here; a command checks
// its components when it is made.
class Component : public Printable<Component> {
 public:
  // A literal component. The dispatcher matches it against `name` and each
  // alias; it has no parser.
  static auto Literal(llvm::StringRef name,
                      llvm::ArrayRef<llvm::StringRef> aliases = {},
                      llvm::StringRef description = "") -> Component;

  // A required argument, valued by `parser`.
  static auto Required(ComponentInfo info, ParserRef parser) -> Component;

  // An optional argument, valued by `parser` when present in the input and by
  // `default_value`, if any, when absent.
  static auto Optional(ComponentInfo info, ParserRef parser,
                       std::optional<DefaultValue> default_value = std::nullopt)
      -> Component;

  // The optional component holding a command's aggregated flags.
  static auto Flags(std::shared_ptr<const FlagParser> parser) -> Component;

  // The name given to the aggregated flag component.
  static constexpr llvm::StringLiteral FlagsName = "flags";

  auto WithSuggestions(SuggestionProviderRef provider) const -> Component;
  auto WithPreprocessors(llvm::ArrayRef<PreprocessorRef> preprocessors) const
      -> Component;
  auto WithValueType(ValueType type) const -> Component;

  // Returns an independent copy. Equivalent to the copy constructor, but reads
  // better at call sites that rely on the copy's independence.
  auto Copy() const -> Component { return *this; }

  // Prints the component's name.
  auto Print(llvm::raw_ostream& out) const -> void { out << name_; }

  auto name() const -> llvm::StringRef { return name_; }
  auto kind() const -> ComponentKind { return kind_; }
  auto required() const -> bool { return required_; }
  auto is_literal() const -> bool { return kind_ == ComponentKind::Literal; }
  auto is_flag() const -> bool { return kind_ == ComponentKind::Flag; }
  auto aliases() const -> llvm::ArrayRef<std::string> { return aliases_; }
  auto description() const -> llvm::StringRef { return description_; }
  auto value_type() const -> ValueType { return value_type_; }

  // Null for literal components.
  auto parser() const -> const ParserRef& { return parser_; }
  auto suggestion_provider() const -> const SuggestionProviderRef& {
    return suggestion_provider_;
  }
  auto preprocessors() const -> llvm::ArrayRef<PreprocessorRef> {
    return preprocessors_;
  }
  auto default_value() const -> const std::optional<DefaultValue>& {
    return default_value_;
  }

 private:
  Component(ComponentKind kind, llvm::StringRef name, bool required,
            ParserRef parser, ValueType value_type)
      : kind_(kind),
        name_(name.str()),
        required_(required),
        parser_(std::move(parser)),
        value_type_(value_type) {}

  ComponentKind kind_;
  std::string name_;
  bool required_;
  llvm::SmallVector<std::string, 0> aliases_;
  std::string description_;
  ParserRef parser_;
  ValueType value_type_;
  SuggestionProviderRef suggestion_provider_;
  llvm::SmallVector<PreprocessorRef, 0> preprocessors_;
  std::optional<DefaultValue> default_value_;
};

// An ordered list of components.
using ComponentList = llvm::SmallVector<Component, 4>;

}  // namespace Herald

#endif  // HERALD_COMMAND_COMPONENT_H_
