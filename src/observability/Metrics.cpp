/***
 * Name: setalg::obs::Metrics (implementation)
 * Purpose: Stage timing and the text/JSON renderings of a Metrics instance.
 */
#include "setalg/observability/Metrics.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace setalg::obs {

namespace {

constexpr double kUsPerMs = 1000.0;

// A hint fires when its counter was recorded and is zero (whenZero) or positive.
struct HintRule {
  std::string_view counter;
  bool whenZero;
  std::string_view hint;
};

constexpr std::array<HintRule, 2> kHintRules{{
    {"strategy.materialize", false, "aux_set_materialized"},
    {"elements.out", true, "empty_result"},
}};

std::string millis(uint64_t micros) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << static_cast<double>(micros) / kUsPerMs;
  return oss.str();
}

std::string lowerAscii(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// `"name": {` then one `"key": value` member per line, closed on its own line.
template <typename KeyFn, typename ValueFn>
void writeJsonObject(std::ostringstream& oss, std::string_view name, const Metrics::Table& table, KeyFn keyOf,
                     ValueFn valueOf) {
  oss << "  \"" << name << "\": {";
  std::string_view sep = "\n";
  for (const auto& [key, value] : table) {
    oss << sep << "    \"" << keyOf(key) << "\": " << valueOf(value);
    sep = ",\n";
  }
  oss << "\n  }";
}

} // namespace

Metrics::Stage::Stage(Metrics& metrics, std::string name) : metrics_(metrics), name_(std::move(name)) {
  metrics_.start(name_);
}

Metrics::Stage::~Stage() { metrics_.stop(name_); }

void Metrics::start(const std::string& name) { running_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  const auto found = running_.find(name);
  if (found == running_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - found->second);
  durationsUs_[name] += static_cast<uint64_t>(elapsed.count());
  running_.erase(found);
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  for (const auto& rule : kHintRules) {
    const auto found = counters_.find(std::string(rule.counter));
    if (found == counters_.end()) { continue; }
    if ((found->second == 0) == rule.whenZero) { out.emplace_back(rule.hint); }
  }
  return out;
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [stage, micros] : durationsUs_) { oss << "  " << stage << ": " << millis(micros) << " ms\n"; }
  for (const Table* table : {&counters_, &gauges_}) {
    for (const auto& [key, value] : *table) { oss << "  " << key << " = " << value << "\n"; }
  }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  const auto sameKey = [](const std::string& key) -> const std::string& { return key; };
  const auto plain = [](uint64_t value) { return value; };
  std::ostringstream oss;
  oss << "{\n";
  writeJsonObject(oss, "durations_ms", durationsUs_, lowerAscii, millis);
  if (!counters_.empty()) {
    oss << ",\n";
    writeJsonObject(oss, "counters", counters_, sameKey, plain);
  }
  if (!gauges_.empty()) {
    oss << ",\n";
    writeJsonObject(oss, "gauges", gauges_, sameKey, plain);
  }
  const auto advice = hints();
  if (!advice.empty()) {
    oss << ",\n  \"hints\": [";
    std::string_view sep;
    for (const auto& hint : advice) {
      oss << sep << "\"" << hint << "\"";
      sep = ", ";
    }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

} // namespace setalg::obs
