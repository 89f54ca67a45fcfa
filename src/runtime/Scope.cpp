/***
 * Name: stackscope::rt scope controller (impl)
 * Purpose: Compose next_id, BindingStore and the encoder/decoder.
 */
#include "stackscope/runtime/Scope.h"

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <utility>

#include "stackscope/config/config.h"
#include "stackscope/runtime/BindingStore.h"
#include "stackscope/runtime/Decoder.h"
#include "stackscope/runtime/IdGenerator.h"
#include "stackscope/runtime/detail/Counters.h"

namespace stackscope::rt {

namespace {

using Store = BindingStore<ScopeId, ContextPtr>;

Store& bindings() {
  static Store store(config::GlobalConfig().storeShards);
  return store;
}

bool debug_enabled() { return config::GlobalConfig().debug; }

void note_live(uint64_t live) {
  auto& peak = detail::counters().peakLiveBindings;
  uint64_t seen = peak.load(std::memory_order_relaxed);
  while (live > seen && !peak.compare_exchange_weak(seen, live, std::memory_order_relaxed)) {}
}

// Owns one binding for the lifetime of a scope.
class BindingGuard {
 public:
  BindingGuard(Store& store, ScopeId id, ContextPtr value) : store_(store), id_(id) {
    store_.store(id_, std::move(value));
    auto& c = detail::counters();
    c.scopesEntered.fetch_add(1, std::memory_order_relaxed);
    note_live(c.liveBindings.fetch_add(1, std::memory_order_relaxed) + 1);
  }
  ~BindingGuard() {
    store_.erase(id_);
    auto& c = detail::counters();
    c.liveBindings.fetch_sub(1, std::memory_order_relaxed);
    c.scopesExited.fetch_add(1, std::memory_order_relaxed);
    if (debug_enabled()) { std::fprintf(stderr, "[stackscope] exit scope id=%" PRIu64 "\n", id_); }
  }
  BindingGuard(const BindingGuard&) = delete;
  BindingGuard& operator=(const BindingGuard&) = delete;

 private:
  Store& store_;
  ScopeId id_;
};

} // namespace

void bind_scope(ContextPtr value, const Continuation& fn) {
  Store& store = bindings();
  const ScopeId id = next_id();
  if (debug_enabled()) { std::fprintf(stderr, "[stackscope] enter scope id=%" PRIu64 "\n", id); }
  const BindingGuard guard(store, id, std::move(value));
  encode_start(id, fn);
}

std::optional<ContextPtr> lookup_context() {
  auto& c = detail::counters();
  c.lookups.fetch_add(1, std::memory_order_relaxed);
  const auto id = last_id();
  std::optional<ContextPtr> found;
  if (id) { found = bindings().load(*id); }
  if (found) {
    c.lookupHits.fetch_add(1, std::memory_order_relaxed);
  } else {
    c.lookupMisses.fetch_add(1, std::memory_order_relaxed);
    if (debug_enabled()) {
      if (id) {
        std::fprintf(stderr, "[stackscope] lookup: id=%" PRIu64 " decoded but not bound\n", *id);
      } else {
        std::fprintf(stderr, "[stackscope] lookup: no enclosing scope\n");
      }
    }
  }
  return found;
}

ContextPtr get_context() {
  auto found = lookup_context();
  return found ? std::move(*found) : nullptr;
}

} // namespace stackscope::rt
