/***
 * Name: setalg::cli::Options
 * Purpose: Everything one setalg invocation needs, as read from argv.
 */
#pragma once

#include <string>
#include <vector>

namespace setalg::cli {

struct Options {
  std::string op{};                     // operation name, e.g. "union" or "issubset"
  std::vector<std::string> operands{};  // collection literals in command line order

  bool showHelp{false};

  // Metrics output: text followed by JSON, or JSON alone.
  bool metrics{false};
  bool metricsJson{false};

  // Ops log, appended under logPath when logOps is set.
  bool logOps{false};
  std::string logPath{"."};
};

} // namespace setalg::cli
