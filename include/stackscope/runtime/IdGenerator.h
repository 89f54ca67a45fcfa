/***
 * Name: stackscope::rt::next_id
 * Purpose: Issue scope identifiers.
 * Theory of Operation: A single process-wide atomic counter; the first id is 1.
 *   Wraparound of the 64-bit space is not handled.
 */
#pragma once

#include <cstdint>

namespace stackscope::rt {
    using ScopeId = std::uint64_t;

    // Strictly increasing, safe to call from any thread.
    ScopeId next_id();
} // namespace stackscope::rt
