/**
 * @file
 * @brief Process-wide atomic counters behind scope_stats().
 */
#pragma once

#include <atomic>
#include <cstdint>

namespace stackscope::rt::detail {

struct Counters {
  std::atomic<uint64_t> scopesEntered{0};
  std::atomic<uint64_t> scopesExited{0};
  std::atomic<uint64_t> lookups{0};
  std::atomic<uint64_t> lookupHits{0};
  std::atomic<uint64_t> lookupMisses{0};
  std::atomic<uint64_t> framesScanned{0};
  std::atomic<uint64_t> liveBindings{0};
  std::atomic<uint64_t> peakLiveBindings{0};
};

Counters& counters();

} // namespace stackscope::rt::detail
