/***
 * Name: exprguard::obs::Metrics
 * Purpose: Collect per-stage timings, counters and AST geometry for visibility.
 * Inputs:
 *   - Calls to start/stop timers for named stages ("extract", "validate").
 *   - Counters bumped by the gate (statements, call sites, violations).
 *   - AST summary values (nodes, depth).
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   stage names to accumulated microseconds, so repeated checks add up.
 *   Formatting is performed on demand.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exprguard::obs {

struct AstGeometry {
  uint64_t nodes{0};
  uint64_t maxDepth{0};
};

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void setAstGeometry(AstGeometry g) { geom_ = g; }
  const std::optional<AstGeometry>& astGeometry() const { return geom_; }

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  uint64_t counter(const std::string& key) const {
    const auto it = counters_.find(key);
    return it == counters_.end() ? 0 : it->second;
  }
  const std::map<std::string, uint64_t>& counters() const { return counters_; }
  const std::map<std::string, uint64_t>& durationsUs() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;
  std::vector<std::string> hints() const;

  void reset();

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::optional<AstGeometry> geom_{};
  std::map<std::string, uint64_t> counters_{};
};

} // namespace exprguard::obs
