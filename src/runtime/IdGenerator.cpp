/***
 * Name: stackscope::rt::next_id (impl)
 * Purpose: Monotonic scope identifier source.
 */
#include "stackscope/runtime/IdGenerator.h"

#include <atomic>

namespace stackscope::rt {

static std::atomic<ScopeId> g_last_id{0}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

ScopeId next_id() { return g_last_id.fetch_add(1, std::memory_order_relaxed) + 1; }

} // namespace stackscope::rt
