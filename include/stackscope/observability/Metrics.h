/***
 * Name: stackscope::obs::Metrics
 * Purpose: Collect named timings, counters and gauges for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Counters and gauges set directly or exported from runtime stats.
 * Outputs:
 *   - Human-readable text and JSON summaries, plus derived hints.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   phase names to microseconds. Formatting is performed on demand.
 *   Not thread-safe; collect from one thread.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "stackscope/runtime/ScopeStats.h"

namespace stackscope::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

  // Generic counters/gauges for observability
  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
  const auto& durationsUs() const { return durations_us_; }

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

/*** RecordScopeStats: Export runtime scope counters as scope.* counters and gauges. */
void RecordScopeStats(Metrics& metrics, const rt::ScopeStats& stats);

} // namespace stackscope::obs
