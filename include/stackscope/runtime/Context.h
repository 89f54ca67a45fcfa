/***
 * Name: stackscope::rt::Context
 * Purpose: Immutable key/value chain bound to a scope by bind_scope/with_context.
 * Inputs: Keys (strings) and values (std::any) attached with withValue.
 * Outputs: value(key) lookups, innermost binding first.
 * Theory of Operation:
 *   Each Context node holds at most one key/value pair and a pointer to its
 *   parent. Deriving never mutates the parent, so a ContextPtr can be shared
 *   freely across threads once built.
 */
#pragma once

#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace stackscope::rt {

class Context;
using ContextPtr = std::shared_ptr<const Context>;

class Context {
 public:
  // The empty root context.
  static ContextPtr background();

  static ContextPtr withValue(ContextPtr parent, std::string key, std::any value);

  // Returns the innermost value stored under key, or nullptr.
  const std::any* value(std::string_view key) const;

  template <typename T>
  const T* valueAs(std::string_view key) const {
    const std::any* v = value(key);
    return v != nullptr ? std::any_cast<T>(v) : nullptr;
  }

  const ContextPtr& parent() const { return parent_; }

  // Number of key/value nodes between this context and the root.
  std::size_t depth() const;

 private:
  struct Private {};

 public:
  Context(Private /*tag*/, ContextPtr parent, std::string key, std::any value, bool hasValue);

 private:
  ContextPtr parent_;
  std::string key_;
  std::any value_;
  bool hasValue_{false};
};

} // namespace stackscope::rt
