// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_BUILDER_H_
#define HERALD_COMMAND_COMMAND_BUILDER_H_

#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

#include "command/argument_parser.h"
#include "command/command.h"
#include "command/command_flag.h"
#include "command/command_meta.h"
#include "command/component.h"
#include "command/compound_parser.h"
#include "command/default_value.h"
#include "command/execution_handler.h"
#include "command/permission.h"
#include "command/sender.h"
#include "common/error.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"

namespace Herald {

// Builds a `Command`.
//
// Builders are immutable: every operation returns a new builder and leaves the
// receiver untouched, so a partially configured builder can be shared and
// extended in several directions. For example:
//
//   auto base = CommandBuilder::Create("teleport", {"tp"})
//                   .WithPermission("server.teleport");
//   auto to_player = base.Required({.name = "target"}, player_parser);
//   auto to_coords = base.Literal("here").Optional(
//       {.name = "x"}, int_parser, DefaultValue::Constant<int>(0));
//   ErrorOr<Command, CommandError> command = to_player.Build();
//
// Operations that need to resolve the default parser for a type take the
// registry to use and fail with a usage error when it is null.
class CommandBuilder {
 public:
  // Starts a builder for a command rooted at a literal named `name`. The
  // handler does nothing and the permission is empty.
  static auto Create(llvm::StringRef name,
                     llvm::ArrayRef<llvm::StringRef> aliases = {},
                     llvm::StringRef description = "") -> CommandBuilder;

  // Appends a copy of `component`. Later changes to `component` do not affect
  // the builder.
  auto Argument(const Component& component) const -> CommandBuilder;

  auto Literal(llvm::StringRef name,
               llvm::ArrayRef<llvm::StringRef> aliases = {},
               llvm::StringRef description = "") const -> CommandBuilder;

  auto Required(ComponentInfo info, ParserRef parser,
                SuggestionProviderRef suggestions = nullptr) const
      -> CommandBuilder;

  auto Optional(ComponentInfo info, ParserRef parser,
                std::optional<DefaultValue> default_value = std::nullopt,
                SuggestionProviderRef suggestions = nullptr) const
      -> CommandBuilder;

  // Appends an argument described by `descriptor`, along with any suggestion
  // provider and preprocessors it offers.
  auto Required(const ArgumentDescriptor& descriptor,
                llvm::StringRef description = "") const -> CommandBuilder;
  auto Optional(const ArgumentDescriptor& descriptor,
                llvm::StringRef description = "",
                std::optional<DefaultValue> default_value = std::nullopt) const
      -> CommandBuilder;

  // Appends an argument using the parser `registry` provides for `T`.
  template <typename T>
  auto Required(const ParserRegistry* registry, ComponentInfo info) const
      -> ErrorOr<CommandBuilder, CommandError>;
  template <typename T>
  auto Optional(const ParserRegistry* registry, ComponentInfo info,
                std::optional<DefaultValue> default_value = std::nullopt) const
      -> ErrorOr<CommandBuilder, CommandError>;

  // Appends one argument made of two values, parsed in order with the parsers
  // `registry` provides for `U` and `V`. `names` label the two values. The
  // result is a `std::pair<U, V>`, or the output of `mapper`.
  template <typename U, typename V>
  auto RequiredPair(const ParserRegistry* registry, ComponentInfo info,
                    std::array<llvm::StringRef, 2> names) const
      -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V, typename O>
  auto RequiredPair(
      const ParserRegistry* registry, ComponentInfo info,
      std::array<llvm::StringRef, 2> names,
      std::function<auto(const CommandContext&, std::pair<U, V>)->O> mapper)
      const -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V>
  auto OptionalPair(const ParserRegistry* registry, ComponentInfo info,
                    std::array<llvm::StringRef, 2> names,
                    std::optional<DefaultValue> default_value = std::nullopt)
      const -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V, typename O>
  auto OptionalPair(
      const ParserRegistry* registry, ComponentInfo info,
      std::array<llvm::StringRef, 2> names,
      std::function<auto(const CommandContext&, std::pair<U, V>)->O> mapper,
      std::optional<DefaultValue> default_value = std::nullopt) const
      -> ErrorOr<CommandBuilder, CommandError>;

  // As with pairs, but with three values producing a `std::tuple<U, V, W>`.
  template <typename U, typename V, typename W>
  auto RequiredTriplet(const ParserRegistry* registry, ComponentInfo info,
                       std::array<llvm::StringRef, 3> names) const
      -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V, typename W, typename O>
  auto RequiredTriplet(
      const ParserRegistry* registry, ComponentInfo info,
      std::array<llvm::StringRef, 3> names,
      std::function<auto(const CommandContext&, std::tuple<U, V, W>)->O> mapper)
      const -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V, typename W>
  auto OptionalTriplet(const ParserRegistry* registry, ComponentInfo info,
                       std::array<llvm::StringRef, 3> names,
                       std::optional<DefaultValue> default_value = std::nullopt)
      const -> ErrorOr<CommandBuilder, CommandError>;
  template <typename U, typename V, typename W, typename O>
  auto OptionalTriplet(
      const ParserRegistry* registry, ComponentInfo info,
      std::array<llvm::StringRef, 3> names,
      std::function<auto(const CommandContext&, std::tuple<U, V, W>)->O> mapper,
      std::optional<DefaultValue> default_value = std::nullopt) const
      -> ErrorOr<CommandBuilder, CommandError>;

  // Replaces the handler.
  auto Handler(ExecutionHandler handler) const -> CommandBuilder;
  // Runs `handler` before the current handler.
  auto PrependHandler(ExecutionHandler handler) const -> CommandBuilder;
  // Runs `handler` after the current handler.
  auto AppendHandler(ExecutionHandler handler) const -> CommandBuilder;

  // Restricts the command to senders of `type`, which must be the current
  // bound or one of its descendants. `type` must outlive the builder and any
  // command built from it.
  auto WithSenderType(const SenderType& type) const -> CommandBuilder;

  // Replaces the permission.
  auto WithPermission(Permission permission) const -> CommandBuilder;
  auto WithPermission(llvm::StringRef permission) const -> CommandBuilder;

  template <typename T>
  auto Meta(MetaKey<T> key, std::type_identity_t<T> value) const
      -> CommandBuilder {
    CommandBuilder copy = *this;
    copy.meta_ = meta_.With(key, std::move(value));
    return copy;
  }

  // Marks the command as hidden from help listings.
  auto Hidden() const -> CommandBuilder { return Meta(HiddenKey, true); }

  // Registers a flag. Flags are collected into a single trailing component when
  // the command is built. Flag names and short names must be unique.
  auto Flag(CommandFlag flag) const -> CommandBuilder;

  // Makes this command a proxy for `other`: appends copies of each of
  // `other`'s non-literal components, adopts its handler, and adopts its
  // permission if this builder has none.
  auto Proxies(const Command& other) const -> CommandBuilder;

  // Returns the result of `fn` on this builder, for reusable chains of
  // operations.
  auto Apply(llvm::function_ref<auto(const CommandBuilder&)->CommandBuilder> fn)
      const -> CommandBuilder {
    return fn(*this);
  }

  // Builds the command. Registered flags are aggregated into a trailing
  // optional component named `flags`. The builder is unchanged, and may be
  // built again or extended.
  //
  // Progress is logged to `vlog_stream` when it is non-null.
  auto Build(llvm::raw_ostream* vlog_stream = nullptr) const
      -> ErrorOr<Command, CommandError>;

  auto components() const -> llvm::ArrayRef<Component> { return components_; }
  auto handler() const -> const ExecutionHandler& { return handler_; }
  auto permission() const -> const Permission& { return permission_; }
  auto sender_type() const -> const SenderType* { return sender_type_; }
  auto meta() const -> const CommandMeta& { return meta_; }
  auto flags() const -> llvm::ArrayRef<CommandFlag> { return flags_; }

 private:
  CommandBuilder(Component root, ExecutionHandler handler,
                 Permission permission);

  // Resolves the parser for each of `types` into `parsers`. `name` is the
  // component being added, for diagnostics.
  static auto ResolveParsers(const ParserRegistry* registry,
                             llvm::StringRef name,
                             llvm::ArrayRef<ValueType> types,
                             llvm::MutableArrayRef<ParserRef> parsers)
      -> ErrorOr<Success, CommandError>;

  // Appends a component parsed by a `CompoundParser` over `Ts`.
  template <typename OutputT, typename... Ts>
  auto AddCompound(const ParserRegistry* registry, ComponentInfo info,
                   std::array<llvm::StringRef, sizeof...(Ts)> names,
                   bool required, std::optional<DefaultValue> default_value,
                   typename CompoundParser<OutputT, Ts...>::MapperT mapper) const
      -> ErrorOr<CommandBuilder, CommandError>;

  CommandMeta meta_;
  const SenderType* sender_type_ = nullptr;
  ComponentList components_;
  ExecutionHandler handler_;
  Permission permission_;
  llvm::SmallVector<CommandFlag> flags_;
};

// Implementation details only below here.

template <typename T>
auto CommandBuilder::Required(const ParserRegistry* registry,
                              ComponentInfo info) const
    -> ErrorOr<CommandBuilder, CommandError> {
  ParserRef parser;
  HERALD_RETURN_IF_ERROR(
      ResolveParsers(registry, info.name, {ValueType::Of<T>()},
                     llvm::MutableArrayRef<ParserRef>(parser)));
  return Required(info, std::move(parser));
}

template <typename T>
auto CommandBuilder::Optional(const ParserRegistry* registry,
                              ComponentInfo info,
                              std::optional<DefaultValue> default_value) const
    -> ErrorOr<CommandBuilder, CommandError> {
  ParserRef parser;
  HERALD_RETURN_IF_ERROR(
      ResolveParsers(registry, info.name, {ValueType::Of<T>()},
                     llvm::MutableArrayRef<ParserRef>(parser)));
  return Optional(info, std::move(parser), std::move(default_value));
}

template <typename OutputT, typename... Ts>
auto CommandBuilder::AddCompound(
    const ParserRegistry* registry, ComponentInfo info,
    std::array<llvm::StringRef, sizeof...(Ts)> names, bool required,
    std::optional<DefaultValue> default_value,
    typename CompoundParser<OutputT, Ts...>::MapperT mapper) const
    -> ErrorOr<CommandBuilder, CommandError> {
  constexpr size_t Arity = sizeof...(Ts);
  std::array<ValueType, Arity> types = {ValueType::Of<Ts>()...};
  std::array<ParserRef, Arity> parsers;
  HERALD_RETURN_IF_ERROR(ResolveParsers(registry, info.name, types, parsers));

  std::array<std::string, Arity> element_names;
  for (size_t i = 0; i < Arity; ++i) {
    element_names[i] = names[i].str();
  }
  ParserRef parser = std::make_shared<CompoundParser<OutputT, Ts...>>(
      std::move(element_names), std::move(parsers), std::move(mapper));
  if (required) {
    return Argument(Component::Required(info, std::move(parser)));
  }
  return Argument(Component::Optional(info, std::move(parser),
                                      std::move(default_value)));
}

template <typename U, typename V>
auto CommandBuilder::RequiredPair(const ParserRegistry* registry,
                                  ComponentInfo info,
                                  std::array<llvm::StringRef, 2> names) const
    -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<std::pair<U, V>, U, V>(
      registry, info, names, /*required=*/true, std::nullopt,
      [](const CommandContext& /*context*/, std::tuple<U, V> values) {
        return std::make_from_tuple<std::pair<U, V>>(std::move(values));
      });
}

template <typename U, typename V, typename O>
auto CommandBuilder::RequiredPair(
    const ParserRegistry* registry, ComponentInfo info,
    std::array<llvm::StringRef, 2> names,
    std::function<auto(const CommandContext&, std::pair<U, V>)->O> mapper)
    const -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<O, U, V>(
      registry, info, names, /*required=*/true, std::nullopt,
      [mapper = std::move(mapper)](const CommandContext& context,
                                   std::tuple<U, V> values) {
        return mapper(context,
                      std::make_from_tuple<std::pair<U, V>>(std::move(values)));
      });
}

template <typename U, typename V>
auto CommandBuilder::OptionalPair(const ParserRegistry* registry,
                                  ComponentInfo info,
                                  std::array<llvm::StringRef, 2> names,
                                  std::optional<DefaultValue> default_value)
    const -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<std::pair<U, V>, U, V>(
      registry, info, names, /*required=*/false, std::move(default_value),
      [](const CommandContext& /*context*/, std::tuple<U, V> values) {
        return std::make_from_tuple<std::pair<U, V>>(std::move(values));
      });
}

template <typename U, typename V, typename O>
auto CommandBuilder::OptionalPair(
    const ParserRegistry* registry, ComponentInfo info,
    std::array<llvm::StringRef, 2> names,
    std::function<auto(const CommandContext&, std::pair<U, V>)->O> mapper,
    std::optional<DefaultValue> default_value) const
    -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<O, U, V>(
      registry, info, names, /*required=*/false, std::move(default_value),
      [mapper = std::move(mapper)](const CommandContext& context,
                                   std::tuple<U, V> values) {
        return mapper(context,
                      std::make_from_tuple<std::pair<U, V>>(std::move(values)));
      });
}

template <typename U, typename V, typename W>
auto CommandBuilder::RequiredTriplet(const ParserRegistry* registry,
                                     ComponentInfo info,
                                     std::array<llvm::StringRef, 3> names) const
    -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<std::tuple<U, V, W>, U, V, W>(
      registry, info, names, /*required=*/true, std::nullopt,
      [](const CommandContext& /*context*/, std::tuple<U, V, W> values) {
        return values;
      });
}

template <typename U, typename V, typename W, typename O>
auto CommandBuilder::RequiredTriplet(
    const ParserRegistry* registry, ComponentInfo info,
    std::array<llvm::StringRef, 3> names,
    std::function<auto(const CommandContext&, std::tuple<U, V, W>)->O> mapper)
    const -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<O, U, V, W>(registry, info, names, /*required=*/true,
                                 std::nullopt, std::move(mapper));
}

template <typename U, typename V, typename W>
auto CommandBuilder::OptionalTriplet(const ParserRegistry* registry,
                                     ComponentInfo info,
                                     std::array<llvm::StringRef, 3> names,
                                     std::optional<DefaultValue> default_value)
    const -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<std::tuple<U, V, W>, U, V, W>(
      registry, info, names, /*required=*/false, std::move(default_value),
      [](const CommandContext& /*context*/, std::tuple<U, V, W> values) {
        return values;
      });
}

template <typename U, typename V, typename W, typename O>
auto CommandBuilder::OptionalTriplet(
    const ParserRegistry* registry, ComponentInfo info,
    std::array<llvm::StringRef, 3> names,
    std::function<auto(const CommandContext&, std::tuple<U, V, W>)->O> mapper,
    std::optional<DefaultValue> default_value) const
    -> ErrorOr<CommandBuilder, CommandError> {
  return AddCompound<O, U, V, W>(registry, info, names, /*required=*/false,
                                 std::move(default_value), std::move(mapper));
}

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_BUILDER_H_
