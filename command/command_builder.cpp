// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/command_builder.h"

#include "command/flag_parser.h"
#include "common/check.h"
#include "common/vlog.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald {

CommandBuilder::CommandBuilder(Component root, ExecutionHandler handler,
                               Permission permission)
    : handler_(std::move(handler)), permission_(std::move(permission)) {
  components_.push_back(std::move(root));
}

auto CommandBuilder::Create(llvm::StringRef name,
                            llvm::ArrayRef<llvm::StringRef> aliases,
                            llvm::StringRef description) -> CommandBuilder {
  return CommandBuilder(Component::Literal(name, aliases, description),
                        NoOpHandler(), Permission::Empty());
}

auto CommandBuilder::Argument(const Component& component) const
    -> CommandBuilder {
  CommandBuilder copy = *this;
  copy.components_.push_back(component.Copy());
  return copy;
}

auto CommandBuilder::Literal(llvm::StringRef name,
                             llvm::ArrayRef<llvm::StringRef> aliases,
                             llvm::StringRef description) const
    -> CommandBuilder {
  return Argument(Component::Literal(name, aliases, description));
}

auto CommandBuilder::Required(ComponentInfo info, ParserRef parser,
                              SuggestionProviderRef suggestions) const
    -> CommandBuilder {
  return Argument(Component::Required(info, std::move(parser))
                      .WithSuggestions(std::move(suggestions)));
}

auto CommandBuilder::Optional(ComponentInfo info, ParserRef parser,
                              std::optional<DefaultValue> default_value,
                              SuggestionProviderRef suggestions) const
    -> CommandBuilder {
  return Argument(
      Component::Optional(info, std::move(parser), std::move(default_value))
          .WithSuggestions(std::move(suggestions)));
}

// Attaches the capabilities a descriptor offers to a component built from it.
static auto WithDescriptorCapabilities(Component component,
                                       const ArgumentDescriptor& descriptor)
    -> Component {
  if (SuggestionProviderRef provider = descriptor.suggestion_provider()) {
    component = component.WithSuggestions(std::move(provider));
  }
  llvm::SmallVector<PreprocessorRef> preprocessors =
      descriptor.preprocessors();
  if (!preprocessors.empty()) {
    component = component.WithPreprocessors(preprocessors);
  }
  return component;
}

auto CommandBuilder::Required(const ArgumentDescriptor& descriptor,
                              llvm::StringRef description) const
    -> CommandBuilder {
  Component component = Component::Required(
      {.name = descriptor.name(), .description = description},
      descriptor.parser());
  return Argument(WithDescriptorCapabilities(std::move(component), descriptor));
}

auto CommandBuilder::Optional(const ArgumentDescriptor& descriptor,
                              llvm::StringRef description,
                              std::optional<DefaultValue> default_value) const
    -> CommandBuilder {
  Component component = Component::Optional(
      {.name = descriptor.name(), .description = description},
      descriptor.parser(), std::move(default_value));
  return Argument(WithDescriptorCapabilities(std::move(component), descriptor));
}

auto CommandBuilder::ResolveParsers(const ParserRegistry* registry,
                                    llvm::StringRef name,
                                    llvm::ArrayRef<ValueType> types,
                                    llvm::MutableArrayRef<ParserRef> parsers)
    -> ErrorOr<Success, CommandError> {
  HERALD_CHECK(types.size() == parsers.size(),
               "Mismatched type and parser counts: {0} vs {1}", types.size(),
               parsers.size());
  if (registry == nullptr) {
    return CommandError::Usage(
        llvm::formatv("cannot add argument `{0}` without a parser registry",
                      name)
            .str());
  }
  for (size_t i = 0; i < types.size(); ++i) {
    parsers[i] = registry->ParserFor(types[i]);
    if (parsers[i] == nullptr) {
      return CommandError::Usage(
          llvm::formatv("no parser is registered for type `{0}` of argument "
                        "`{1}`",
                        types[i], name)
              .str());
    }
  }
  return Success();
}

auto CommandBuilder::Handler(ExecutionHandler handler) const -> CommandBuilder {
  CommandBuilder copy = *this;
  copy.handler_ = std::move(handler);
  return copy;
}

auto CommandBuilder::PrependHandler(ExecutionHandler handler) const
    -> CommandBuilder {
  return Handler(ComposeHandlers({std::move(handler), handler_}));
}

auto CommandBuilder::AppendHandler(ExecutionHandler handler) const
    -> CommandBuilder {
  return Handler(ComposeHandlers({handler_, std::move(handler)}));
}

auto CommandBuilder::WithSenderType(const SenderType& type) const
    -> CommandBuilder {
  HERALD_CHECK(sender_type_ == nullptr || type.IsA(*sender_type_),
               "Sender type `{0}` does not narrow the current bound `{1}`",
               type, *sender_type_);
  CommandBuilder copy = *this;
  copy.sender_type_ = &type;
  return copy;
}

auto CommandBuilder::WithPermission(Permission permission) const
    -> CommandBuilder {
  CommandBuilder copy = *this;
  copy.permission_ = std::move(permission);
  return copy;
}

auto CommandBuilder::WithPermission(llvm::StringRef permission) const
    -> CommandBuilder {
  return WithPermission(Permission::Of(permission));
}

auto CommandBuilder::Flag(CommandFlag flag) const -> CommandBuilder {
  for (const CommandFlag& existing : flags_) {
    HERALD_CHECK(existing.name() != flag.name(),
                 "Flag `--{0}` is already registered.", flag.name());
    HERALD_CHECK(flag.short_name() == 0 ||
                     existing.short_name() != flag.short_name(),
                 "Short flag `-{0}` is already registered.", flag.short_name());
  }
  CommandBuilder copy = *this;
  copy.flags_.push_back(std::move(flag));
  return copy;
}

auto CommandBuilder::Proxies(const Command& other) const -> CommandBuilder {
  CommandBuilder copy = *this;
  for (const Component& component : other.components()) {
    if (component.is_literal()) {
      continue;
    }
    copy.components_.push_back(component.Copy());
  }
  if (copy.permission_.IsEmpty()) {
    copy.permission_ = other.permission();
  }
  copy.handler_ = other.handler();
  return copy;
}

auto CommandBuilder::Build(llvm::raw_ostream* vlog_stream) const
    -> ErrorOr<Command, CommandError> {
  ComponentList components = components_;
  if (!flags_.empty()) {
    HERALD_VLOG_TO(vlog_stream, "Aggregating {0} flags into `{1}`\n",
                   flags_.size(), Component::FlagsName);
    components.push_back(
        Component::Flags(std::make_shared<FlagParser>(flags_)));
  }

  auto flag_components =
      llvm::count_if(components, [](const Component& component) {
        return component.is_flag();
      });
  if (flag_components > 1) {
    HERALD_VLOG_TO(vlog_stream,
                   "Found {0} flag components; only the first is used\n",
                   flag_components);
  }

  auto command = Command::Make(std::move(components), handler_, sender_type_,
                               permission_, meta_);
  if (!command.ok()) {
    HERALD_VLOG_TO(vlog_stream, "Failed to build command: {0}\n",
                   command.error());
    return command;
  }
  HERALD_VLOG_TO(vlog_stream, "Built command `{0}`\n", *command);
  return command;
}

}  // namespace Herald
