// Part of the Herald project, under the Apache License v2.0 with LLVM
// Exceptions. See /LICENSE for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception

#ifndef HERALD_COMMAND_COMMAND_META_H_
#define HERALD_COMMAND_COMMAND_META_H_

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "common/ostream.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"

namespace Herald {

// The values a meta entry may hold.
using MetaValue = std::variant<bool, int64_t, std::string>;

// A typed key into `CommandMeta`.
template <typename T>
class MetaKey {
 public:
  static_assert(std::is_same_v<T, bool> || std::is_same_v<T, int64_t> ||
                    std::is_same_v<T, std::string>,
                "Meta values must be bool, int64_t or std::string.");

  explicit constexpr MetaKey(llvm::StringRef name) : name_(name) {}

  auto name() const -> llvm::StringRef { return name_; }

 private:
  llvm::StringRef name_;
};

// Marks a command that should not be listed in help output.
inline constexpr MetaKey<bool> HiddenKey("hidden");

// An immutable key-value bag describing a command.
class CommandMeta : public Printable<CommandMeta> {
 public:
  // Returns the value for `key`, or nullopt if it is absent or holds a
  // different type.
  template <typename T>
  auto Get(MetaKey<T> key) const -> std::optional<T> {
    auto it = values_.find(key.name());
    if (it == values_.end()) {
      return std::nullopt;
    }
    if (const T* value = std::get_if<T>(&it->second)) {
      return *value;
    }
    return std::nullopt;
  }

  template <typename T>
  auto GetOrDefault(MetaKey<T> key, std::type_identity_t<T> default_value) const
      -> T {
    return Get(key).value_or(std::move(default_value));
  }

  // Returns a copy of this bag with `key` set to `value`.
  template <typename T>
  auto With(MetaKey<T> key, std::type_identity_t<T> value) const
      -> CommandMeta {
    CommandMeta copy = *this;
    copy.values_[key.name()] =
        MetaValue(std::in_place_type<T>, std::move(value));
    return copy;
  }

  auto size() const -> size_t { return values_.size(); }

  // Prints `key=value` entries sorted by key.
  auto Print(llvm::raw_ostream& out) const -> void;

 private:
  llvm::StringMap<MetaValue> values_;
};

}  // namespace Herald

#endif  // HERALD_COMMAND_COMMAND_META_H_
