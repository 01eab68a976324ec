// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_ARGUMENT_PARSER_H_
#define HERALD_COMMAND_ARGUMENT_PARSER_H_

#include <memory>
#include <string>

#include "command/command_context.h"
#include "command/value_type.h"
#include "common/error.h"
#include "llvm/ADT/Any.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// Parses one component's value from the front of the input. Implementations
// are supplied by the host and must be stateless, since a single parser may be
// shared by many commands.
class ArgumentParser {
 public:
  virtual ~ArgumentParser() = default;

  // The type of the value produced by `Parse`.
  virtual auto value_type() const -> ValueType = 0;

  // Consumes the tokens making up one value. On failure, the amount of input
  // consumed is unspecified.
  virtual auto Parse(CommandContext& context, CommandInput& input) const
      -> ErrorOr<llvm::Any> = 0;
};

using ParserRef = std::shared_ptr<const ArgumentParser>;

// Offers completions for a partially typed component.
class SuggestionProvider {
 public:
  virtual ~SuggestionProvider() = default;

  virtual auto Suggestions(const CommandContext& context,
                           const CommandInput& input) const
      -> llvm::SmallVector<std::string> = 0;
};

using SuggestionProviderRef = std::shared_ptr<const SuggestionProvider>;

// Runs before a component's parser, for example to reject input early.
class ComponentPreprocessor {
 public:
  virtual ~ComponentPreprocessor() = default;

  virtual auto Preprocess(CommandContext& context, CommandInput& input) const
      -> ErrorOr<Success> = 0;
};

using PreprocessorRef = std::shared_ptr<const ComponentPreprocessor>;

// A reusable argument definition: a key naming the argument together with its
// parser. Descriptors may also offer suggestions and preprocessors, which are
// attached to components built from them.
class ArgumentDescriptor {
 public:
  virtual ~ArgumentDescriptor() = default;

  virtual auto name() const -> llvm::StringRef = 0;
  virtual auto parser() const -> ParserRef = 0;

  // Returns null when the descriptor has no suggestions of its own.
  virtual auto suggestion_provider() const -> SuggestionProviderRef {
    return nullptr;
  }

  virtual auto preprocessors() const -> llvm::SmallVector<PreprocessorRef> {
    return {};
  }
};

// Resolves a value type to the parser used for it by default.
class ParserRegistry {
 public:
  virtual ~ParserRegistry() = default;

  // Returns null if no parser is registered for `type`.
  virtual auto ParserFor(ValueType type) const -> ParserRef = 0;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_ARGUMENT_PARSER_H_
