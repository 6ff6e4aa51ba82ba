/***
 * Name: setalg::obs::Metrics
 * Purpose: Collect per-stage timings and evaluation counters for the setalg tool.
 * Inputs:
 *   - Stage timers for named phases (Parse, Evaluate), either through
 *     start/stop or a scoped Metrics::Stage.
 *   - Counters and gauges recorded by the evaluator (operands, element
 *     counts, membership strategy decisions).
 * Outputs:
 *   - Human-readable text and JSON summaries, plus derived hints.
 * Theory of Operation:
 *   Durations are kept in microseconds per stage and accumulate when a stage
 *   runs more than once. All tables are ordered maps so both summaries list
 *   keys alphabetically. Instances are owned by the caller; there is no
 *   process-wide registry.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace setalg::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;
  using Table = std::map<std::string, uint64_t>;

  // Times one stage for the lifetime of the object, including early returns and throws.
  class Stage {
   public:
    Stage(Metrics& metrics, std::string name);
    ~Stage();
    Stage(const Stage&) = delete;
    Stage& operator=(const Stage&) = delete;

   private:
    Metrics& metrics_;
    std::string name_;
  };

  void start(const std::string& name);
  // Stopping a stage that was never started is ignored.
  void stop(const std::string& name);

  std::string summaryText() const;
  std::string summaryJson() const;

  // Advice derived from counters: "aux_set_materialized", "empty_result".
  std::vector<std::string> hints() const;

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }

  const Table& counters() const { return counters_; }
  const Table& gauges() const { return gauges_; }
  const Table& durations() const { return durationsUs_; }

 private:
  std::map<std::string, Clock::time_point> running_{};
  Table durationsUs_{};
  Table counters_{};
  Table gauges_{};
};

} // namespace setalg::obs
