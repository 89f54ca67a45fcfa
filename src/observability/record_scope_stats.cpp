/***
 * Name: stackscope::obs::RecordScopeStats
 * Purpose: Copy a ScopeStats snapshot into a Metrics instance.
 * Inputs:
 *   - metrics: destination
 *   - stats: snapshot from rt::scope_stats()
 * Outputs: None
 * Theory of Operation: Monotonic totals become counters; live/peak binding counts become gauges.
 */
#include "stackscope/observability/Metrics.h"

namespace stackscope::obs {

void RecordScopeStats(Metrics& metrics, const rt::ScopeStats& stats) {
  metrics.setCounter("scope.entered", stats.scopesEntered);
  metrics.setCounter("scope.exited", stats.scopesExited);
  metrics.setCounter("scope.lookups", stats.lookups);
  metrics.setCounter("scope.lookup_hits", stats.lookupHits);
  metrics.setCounter("scope.lookup_misses", stats.lookupMisses);
  metrics.setCounter("scope.frames_scanned", stats.framesScanned);
  metrics.setGauge("scope.live_bindings", stats.liveBindings);
  metrics.setGauge("scope.peak_live_bindings", stats.peakLiveBindings);
}

} // namespace stackscope::obs
