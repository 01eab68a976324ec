// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMPOUND_PARSER_H_
#define HERALD_COMMAND_COMPOUND_PARSER_H_

#include <array>
#include <functional>
#include <string>
#include <tuple>
#include <utility>

#include "command/argument_parser.h"
#include "common/check.h"
#include "common/error.h"
#include "llvm/ADT/Any.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald {

// Parses a fixed sequence of values with one sub-parser each, then maps the
// resulting tuple to `OutputT`. Sub-parsers read from the same input, in
// order.
template <typename OutputT, typename... Ts>
class CompoundParser : public ArgumentParser {
 public:
  static constexpr size_t Arity = sizeof...(Ts);

  using TupleT = std::tuple<Ts...>;
  using MapperT = std::function<auto(const CommandContext&, TupleT)->OutputT>;

  // `names` label the elements in diagnostics.
  CompoundParser(std::array<std::string, Arity> names,
                 std::array<ParserRef, Arity> parsers, MapperT mapper)
      : names_(std::move(names)),
        parsers_(std::move(parsers)),
        mapper_(std::move(mapper)) {
    for (const ParserRef& parser : parsers_) {
      HERALD_CHECK(parser != nullptr, "Compound element has no parser.");
    }
    HERALD_CHECK(mapper_ != nullptr, "Compound parser has no mapper.");
  }

  auto value_type() const -> ValueType override {
    return ValueType::Of<OutputT>();
  }

  auto Parse(CommandContext& context, CommandInput& input) const
      -> ErrorOr<llvm::Any> override {
    std::array<llvm::Any, Arity> elements;
    for (size_t i = 0; i < Arity; ++i) {
      if (input.empty()) {
        return Error(llvm::formatv("missing value for `{0}`", names_[i]).str());
      }
      HERALD_ASSIGN_OR_RETURN(elements[i], parsers_[i]->Parse(context, input));
    }
    return ParseElements(context, elements, std::index_sequence_for<Ts...>());
  }

  auto names() const -> const std::array<std::string, Arity>& {
    return names_;
  }

 private:
  template <size_t... Is>
  auto ParseElements(const CommandContext& context,
                     std::array<llvm::Any, Arity>& elements,
                     std::index_sequence<Is...> /*indices*/) const
      -> ErrorOr<llvm::Any> {
    bool types_match =
        (llvm::any_isa<std::tuple_element_t<Is, TupleT>>(elements[Is]) && ...);
    if (!types_match) {
      return Error("compound element parser produced a value of the wrong type");
    }
    OutputT output = mapper_(
        context,
        TupleT(std::move(
            *llvm::any_cast<std::tuple_element_t<Is, TupleT>>(&elements[Is]))...));
    return llvm::Any(std::move(output));
  }

  std::array<std::string, Arity> names_;
  std::array<ParserRef, Arity> parsers_;
  MapperT mapper_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMPOUND_PARSER_H_
