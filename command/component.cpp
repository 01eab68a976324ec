// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/component.h"

#include "command/flag_parser.h"

namespace Herald {

auto operator<<(llvm::raw_ostream& out, ComponentKind kind)
    -> llvm::raw_ostream& {
  switch (kind) {
    case ComponentKind::Literal:
      return out << "literal";
    case ComponentKind::Argument:
      return out << "argument";
    case ComponentKind::Flag:
      return out << "flag";
  }
  return out;
}

auto Component::Literal(llvm::StringRef name,
                        llvm::ArrayRef<llvm::StringRef> aliases,
                        llvm::StringRef description) -> Component {
  Component component(ComponentKind::Literal, name, /*required=*/true,
                      /*parser=*/nullptr, ValueType::Of<std::string>());
  for (llvm::StringRef alias : aliases) {
    component.aliases_.push_back(alias.str());
  }
  component.description_ = description.str();
  return component;
}

auto Component::Required(ComponentInfo info, ParserRef parser) -> Component {
  ValueType type = parser ? parser->value_type() : ValueType::Untyped();
  Component component(ComponentKind::Argument, info.name, /*required=*/true,
                      std::move(parser), type);
  component.description_ = info.description.str();
  return component;
}

auto Component::Optional(ComponentInfo info, ParserRef parser,
                         std::optional<DefaultValue> default_value)
    -> Component {
  ValueType type = parser ? parser->value_type() : ValueType::Untyped();
  Component component(ComponentKind::Argument, info.name, /*required=*/false,
                      std::move(parser), type);
  component.description_ = info.description.str();
  component.default_value_ = std::move(default_value);
  return component;
}

auto Component::Flags(std::shared_ptr<const FlagParser> parser) -> Component {
  Component component(ComponentKind::Flag, FlagsName, /*required=*/false,
                      std::move(parser), ValueType::Untyped());
  component.description_ = "Command flags";
  return component;
}

auto Component::WithSuggestions(SuggestionProviderRef provider) const
    -> Component {
  Component copy = *this;
  copy.suggestion_provider_ = std::move(provider);
  return copy;
}

auto Component::WithPreprocessors(
    llvm::ArrayRef<PreprocessorRef> preprocessors) const -> Component {
  Component copy = *this;
  copy.preprocessors_.assign(preprocessors.begin(), preprocessors.end());
  return copy;
}

auto Component::WithValueType(ValueType type) const -> Component {
  Component copy = *this;
  copy.value_type_ = type;
  return copy;
}

}  // namespace Herald
