/***
 * Name: stackscope::rt::scope_stats (impl)
 * Purpose: Snapshot and reset the scope counters.
 * Theory of Operation: Counters are relaxed atomics; a snapshot is not a
 *   consistent cut across fields while other threads are entering scopes.
 */
#include "stackscope/runtime/ScopeStats.h"
#include "stackscope/runtime/detail/Counters.h"

#include <atomic>

namespace stackscope::rt {

namespace detail {

Counters& counters() {
  static Counters c;
  return c;
}

} // namespace detail

ScopeStats scope_stats() {
  const auto& c = detail::counters();
  ScopeStats st;
  st.scopesEntered = c.scopesEntered.load(std::memory_order_relaxed);
  st.scopesExited = c.scopesExited.load(std::memory_order_relaxed);
  st.lookups = c.lookups.load(std::memory_order_relaxed);
  st.lookupHits = c.lookupHits.load(std::memory_order_relaxed);
  st.lookupMisses = c.lookupMisses.load(std::memory_order_relaxed);
  st.framesScanned = c.framesScanned.load(std::memory_order_relaxed);
  st.liveBindings = c.liveBindings.load(std::memory_order_relaxed);
  st.peakLiveBindings = c.peakLiveBindings.load(std::memory_order_relaxed);
  return st;
}

void scope_reset_stats_for_tests() {
  auto& c = detail::counters();
  c.scopesEntered.store(0, std::memory_order_relaxed);
  c.scopesExited.store(0, std::memory_order_relaxed);
  c.lookups.store(0, std::memory_order_relaxed);
  c.lookupHits.store(0, std::memory_order_relaxed);
  c.lookupMisses.store(0, std::memory_order_relaxed);
  c.framesScanned.store(0, std::memory_order_relaxed);
  // Live bindings belong to scopes that may still be running; only the peak restarts.
  c.peakLiveBindings.store(c.liveBindings.load(std::memory_order_relaxed), std::memory_order_relaxed);
}

} // namespace stackscope::rt
