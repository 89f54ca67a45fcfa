/***
 * Name: stackscope::rt::ScopeStats
 * Purpose: Expose scope and lookup counters to tests and tooling.
 */
#pragma once

#include <cstdint>

namespace stackscope::rt {
    struct ScopeStats {
        uint64_t scopesEntered{0};
        uint64_t scopesExited{0};
        uint64_t lookups{0};
        uint64_t lookupHits{0};
        uint64_t lookupMisses{0};
        uint64_t framesScanned{0}; // frames visited by the decoder across all lookups
        uint64_t liveBindings{0};
        uint64_t peakLiveBindings{0};
    };

    ScopeStats scope_stats();

    void scope_reset_stats_for_tests();
} // namespace stackscope::rt
