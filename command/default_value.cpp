// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/default_value.h"

#include "common/check.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald {

auto DefaultValue::Evaluate(CommandContext& context,
                            const ArgumentParser* parser) const
    -> ErrorOr<llvm::Any> {
  switch (kind_) {
    case Kind::Constant:
      return constant_;
    case Kind::Dynamic:
      return supplier_(context);
    case Kind::Parsed: {
      if (parser == nullptr) {
        return Error(
            llvm::formatv("no parser available for default value `{0}`",
                          text_)
                .str());
      }
      llvm::SmallVector<llvm::StringRef> tokens;
      llvm::StringRef(text_).split(tokens, ' ', /*MaxSplit=*/-1,
                                   /*KeepEmpty=*/false);
      CommandInput input(tokens);
      HERALD_ASSIGN_OR_RETURN(llvm::Any value, parser->Parse(context, input));
      if (!input.empty()) {
        return Error(llvm::formatv("default value `{0}` has trailing input `{1}`",
                                   text_, input.Peek())
                         .str());
      }
      return value;
    }
  }
  HERALD_FATAL("Unknown default value kind.");
}

auto DefaultValue::Print(llvm::raw_ostream& out) const -> void {
  switch (kind_) {
    case Kind::Constant:
      out << "<constant>";
      return;
    case Kind::Parsed:
      out << text_;
      return;
    case Kind::Dynamic:
      out << "<dynamic>";
      return;
  }
}

}  // namespace Herald
