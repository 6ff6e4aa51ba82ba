/***
 * Name: setalg::Tool::use_env_metrics
 * Purpose: SETALG_METRICS set to 1, true or yes (any case) turns on --metrics.
 */
#include "setalg/tool/Tool.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdlib>
#include <string_view>

namespace setalg {

namespace {

constexpr std::array<std::string_view, 3> kTrueValues{"1", "true", "yes"};

bool sameIgnoringCase(std::string_view lhs, std::string_view rhs) {
  return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) { return std::tolower(a) == std::tolower(b); });
}

} // namespace

bool Tool::use_env_metrics() {
  const char* raw = std::getenv("SETALG_METRICS");
  if (raw == nullptr) { return false; }
  const std::string_view value{raw};
  return std::ranges::any_of(kTrueValues, [value](std::string_view accepted) { return sameIgnoringCase(value, accepted); });
}

} // namespace setalg
