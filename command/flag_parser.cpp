// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#include "command/flag_parser.h"

#include <string>

#include "common/check.h"
#include "llvm/Support/FormatVariadic.h"

namespace Herald {

FlagParser::FlagParser(llvm::ArrayRef<CommandFlag> flags)
    : flags_(flags.begin(), flags.end()) {
  by_short_name_.fill(-1);
  for (int index = 0; index < static_cast<int>(flags_.size()); ++index) {
    const CommandFlag& flag = flags_[index];
    bool inserted = by_name_.try_emplace(flag.name(), index).second;
    HERALD_CHECK(inserted, "Duplicate flag name: `--{0}`", flag.name());
    if (char c = flag.short_name()) {
      int& entry = by_short_name_[static_cast<unsigned char>(c)];
      HERALD_CHECK(entry == -1, "Duplicate short flag name: `-{0}`", c);
      entry = index;
    }
  }
}

auto FlagParser::Lookup(llvm::StringRef name) const -> const CommandFlag* {
  auto it = by_name_.find(name);
  return it == by_name_.end() ? nullptr : &flags_[it->second];
}

auto FlagParser::LookupShort(char short_name) const -> const CommandFlag* {
  auto c = static_cast<unsigned char>(short_name);
  if (c >= by_short_name_.size() || by_short_name_[c] == -1) {
    return nullptr;
  }
  return &flags_[by_short_name_[c]];
}

// Splits a trailing `=value` off of `token`, if present.
static auto SplitValue(llvm::StringRef& token)
    -> std::optional<llvm::StringRef> {
  auto [name, value] = token.split('=');
  if (name.size() == token.size()) {
    return std::nullopt;
  }
  token = name;
  return value;
}

auto FlagParser::Parse(CommandContext& context, CommandInput& input) const
    -> ErrorOr<llvm::Any> {
  FlagValues values;
  while (!input.empty()) {
    llvm::StringRef token = input.Read();
    if (token.size() > 2 && token.substr(0, 2) == "--") {
      HERALD_RETURN_IF_ERROR(ParseLongFlag(token, context, input, values));
      continue;
    }
    if (token.size() > 1 && token.front() == '-' && token[1] != '-') {
      HERALD_RETURN_IF_ERROR(ParseShortFlagSeq(token, context, input, values));
      continue;
    }
    return Error(
        llvm::formatv("found unexpected argument `{0}`; only flags may follow",
                      token)
            .str());
  }
  return llvm::Any(std::move(values));
}

auto FlagParser::ParseLongFlag(llvm::StringRef token, CommandContext& context,
                               CommandInput& input, FlagValues& values) const
    -> ErrorOr<Success> {
  // Walk past the double dash.
  token = token.drop_front(2);
  std::optional<llvm::StringRef> value = SplitValue(token);

  const CommandFlag* flag = Lookup(token);
  if (flag == nullptr) {
    return Error(llvm::formatv("unknown flag `--{0}`", token).str());
  }
  return ParseFlag(*flag, llvm::formatv("`--{0}`", flag->name()).str(), value,
                   context, input, values);
}

auto FlagParser::ParseShortFlagSeq(llvm::StringRef token,
                                   CommandContext& context, CommandInput& input,
                                   FlagValues& values) const
    -> ErrorOr<Success> {
  token = token.drop_front();
  std::optional<llvm::StringRef> value = SplitValue(token);
  if (value && token.size() != 1) {
    return Error(llvm::formatv(
                     "cannot provide a value to the group of multiple short "
                     "flags `-{0}=...`; values must be provided to a single "
                     "flag, using either the short or long spelling",
                     token)
                     .str());
  }

  for (size_t index = 0; index < token.size(); ++index) {
    char c = token[index];
    const CommandFlag* flag = LookupShort(c);
    if (flag == nullptr) {
      return Error(llvm::formatv("unknown short flag `-{0}`", c).str());
    }
    std::string spelling =
        llvm::formatv("`-{0}` (short for `--{1}`)", c, flag->name()).str();
    bool is_last = index + 1 == token.size();
    if (flag->has_value() && !is_last) {
      return Error(llvm::formatv("flag {0} takes a value, so it must be the "
                                 "last flag in the group `-{1}`",
                                 spelling, token)
                       .str());
    }
    HERALD_RETURN_IF_ERROR(
        ParseFlag(*flag, spelling, value, context, input, values));
  }
  return Success();
}

auto FlagParser::ParseFlag(const CommandFlag& flag, llvm::StringRef spelling,
                           std::optional<llvm::StringRef> value,
                           CommandContext& context, CommandInput& input,
                           FlagValues& values) const -> ErrorOr<Success> {
  FlagValues::Entry& entry = values.entries_[flag.name()];
  if (entry.count > 0 && !flag.repeatable()) {
    return Error(
        llvm::formatv("flag {0} may only be provided once", spelling).str());
  }
  ++entry.count;

  if (!flag.has_value()) {
    if (value) {
      return Error(llvm::formatv("flag {0} cannot be used with a value, and "
                                 "`{1}` was provided",
                                 spelling, *value)
                       .str());
    }
    return Success();
  }

  if (value) {
    llvm::StringRef tokens[] = {*value};
    CommandInput value_input(tokens);
    HERALD_ASSIGN_OR_RETURN(llvm::Any parsed,
                            flag.parser()->Parse(context, value_input));
    if (!value_input.empty()) {
      return Error(llvm::formatv("invalid value `{0}` for flag {1}", *value,
                                 spelling)
                       .str());
    }
    entry.values.push_back(std::move(parsed));
    return Success();
  }

  if (input.empty()) {
    return Error(llvm::formatv(
                     "flag {0} requires a value to be provided and none was",
                     spelling)
                     .str());
  }
  HERALD_ASSIGN_OR_RETURN(llvm::Any parsed, flag.parser()->Parse(context, input));
  entry.values.push_back(std::move(parsed));
  return Success();
}

}  // namespace Herald
