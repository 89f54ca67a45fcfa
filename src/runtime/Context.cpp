/***
 * Name: stackscope::rt::Context (impl)
 * Purpose: Build and search immutable context chains.
 */
#include "stackscope/runtime/Context.h"

#include <any>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace stackscope::rt {

Context::Context(Private /*tag*/, ContextPtr parent, std::string key, std::any value, bool hasValue)
    : parent_(std::move(parent)), key_(std::move(key)), value_(std::move(value)), hasValue_(hasValue) {}

ContextPtr Context::background() {
  static const ContextPtr root = std::make_shared<Context>(Private{}, nullptr, std::string{}, std::any{}, false);
  return root;
}

ContextPtr Context::withValue(ContextPtr parent, std::string key, std::any value) {
  if (!parent) { parent = background(); }
  return std::make_shared<Context>(Private{}, std::move(parent), std::move(key), std::move(value), true);
}

const std::any* Context::value(std::string_view key) const {
  for (const Context* cur = this; cur != nullptr; cur = cur->parent_.get()) {
    if (cur->hasValue_ && cur->key_ == key) { return &cur->value_; }
  }
  return nullptr;
}

std::size_t Context::depth() const {
  std::size_t n = 0;
  for (const Context* cur = this; cur != nullptr; cur = cur->parent_.get()) {
    if (cur->hasValue_) { ++n; }
  }
  return n;
}

} // namespace stackscope::rt
