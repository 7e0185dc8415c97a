/***
 * Name: exprguard::obs::Metrics (impl)
 * Purpose: Implement simple timing and formatting.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace exprguard::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kIndent4 = 4;
constexpr uint64_t kLargeAstNodes = 5000U;
} // namespace

static std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

static void appendDurations(std::ostringstream& oss,
                            const std::map<std::string, uint64_t>& durations) {
  oss << "  \"durations_ms\": {";
  bool first = true;
  for (const auto& [key, val] : durations) {
    if (!first) { oss << ","; }
    first = false;
    const double millis = static_cast<double>(val) / kUsPerMs;
    // JSON uses lowercase stage keys for stability
    oss << "\n    \"" << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(3) << millis;
  }
  oss << (durations.empty() ? "}" : "\n  }");
}

static void appendAst(std::ostringstream& oss, const std::optional<AstGeometry>& geom) {
  if (!geom) { return; }
  oss << ",\n  \"ast\": { \"nodes\": " << geom->nodes
      << ", \"max_depth\": " << geom->maxDepth << " }";
}

static void appendKeyValueObject(std::ostringstream& oss,
                                 const std::map<std::string, uint64_t>& values,
                                 int indent) {
  const std::string pad(indent, ' ');
  bool first = true;
  for (const auto& [key, val] : values) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n" << pad << "\"" << key << "\": " << val;
  }
}

void Metrics::start(const std::string& name) {
  active_[name] = Clock::now();
}

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second).count();
  durations_us_[name] += static_cast<uint64_t>(microseconds);
  active_.erase(iter);
}

void Metrics::reset() {
  active_.clear();
  durations_us_.clear();
  geom_.reset();
  counters_.clear();
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    const double millis = static_cast<double>(val) / kUsPerMs;
    oss << "  " << key << ": " << std::fixed << std::setprecision(3) << millis << " ms\n";
  }
  if (geom_) {
    oss << "  AST: nodes=" << geom_->nodes << ", max_depth=" << geom_->maxDepth << "\n";
  }
  for (const auto& [key, val] : counters_) {
    oss << "  " << key << " = " << val << "\n";
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{\n";
  appendDurations(oss, durations_us_);
  appendAst(oss, geom_);
  if (!counters_.empty()) {
    oss << ",\n  \"counters\": {";
    appendKeyValueObject(oss, counters_, kIndent4);
    oss << "\n  }";
  }
  auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (size_t i = 0; i < hs.size(); ++i) {
      if (i != 0) oss << ", ";
      oss << "\"" << hs[i] << "\"";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  for (const auto& [key, val] : counters_) {
    if (key.rfind("violations.", 0) == 0 && val > 0) { out.emplace_back("violations_present"); break; }
  }
  if (geom_ && geom_->nodes > kLargeAstNodes) { out.emplace_back("large_ast"); }
  return out;
}

} // namespace exprguard::obs
