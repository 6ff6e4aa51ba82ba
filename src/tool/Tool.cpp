/***
 * Name: setalg::Tool::run
 * Purpose: Parse, evaluate and report one set operation.
 */
#include "setalg/tool/Tool.h"
#include "setalg/cli/Options.h"
#include "setalg/eval/Evaluator.h"
#include "setalg/exceptions/config_error.h"
#include "setalg/exceptions/setalg_exception.h"
#include "setalg/observability/Metrics.h"
#include "setalg/support/fs.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace setalg {

static std::string timestamp_prefix() {
  auto tsNow = std::chrono::system_clock::now();
  const std::time_t tsTime = std::chrono::system_clock::to_time_t(tsNow);
  std::tm tmBuf{};
#ifdef _WIN32
  localtime_s(&tmBuf, &tsTime);
#else
  localtime_r(&tsTime, &tmBuf);
#endif
  std::ostringstream timestampStream;
  timestampStream << std::put_time(&tmBuf, "%Y%m%d-%H%M%S");
  return timestampStream.str() + "-";
}

static void write_ops_log(const cli::Options& opts, const std::string& rendered, std::ostream& err) {
  const std::string logDir = opts.logPath.empty() ? std::string(".") : opts.logPath;
  std::string ioErr;
  // A missing log directory disables file logging; the result is still printed.
  if (!support::EnsureDirectory(logDir, ioErr)) {
    err << "setalg: " << ioErr << "\n";
    return;
  }
  std::ostringstream entry;
  entry << "op=" << opts.op << "\n";
  for (const auto& operand : opts.operands) { entry << "operand=" << operand << "\n"; }
  entry << "result=" << rendered << "\n";
  if (!support::AppendFile(logDir + "/" + timestamp_prefix() + "setalg.ops.log", entry.str(), ioErr)) {
    err << "setalg: " << ioErr << "\n";
  }
}

int Tool::run(const cli::Options& opts, std::ostream& out, std::ostream& err) {
  obs::Metrics metrics;

  std::optional<eval::OpKind> op;
  std::vector<eval::Operand> operands;
  try {
    obs::Metrics::Stage parse(metrics, "Parse");
    op = eval::parseOpKind(opts.op);
    if (!op) {
      err << "setalg: unknown operation '" << opts.op << "'\n";
      return kExitUsage;
    }
    for (const auto& text : opts.operands) { operands.push_back(eval::parseOperand(text)); }
  } catch (const exceptions::SetalgException& ex) {
    err << "setalg: " << ex.what() << "\n";
    return kExitEvalError;
  }

  eval::Result result;
  try {
    obs::Metrics::Stage evaluate(metrics, "Evaluate");
    result = eval::evaluate(*op, operands, &metrics);
  } catch (const exceptions::ConfigError& ex) {
    err << "setalg: " << ex.what() << "\n";
    return kExitUsage;
  } catch (const exceptions::SetalgException& ex) {
    err << "setalg: " << ex.what() << "\n";
    return kExitEvalError;
  }

  const std::string rendered = eval::formatResult(result);
  out << rendered << "\n";

  if (opts.logOps) { write_ops_log(opts, rendered, err); }

  // - With --metrics-json: JSON only
  // - With --metrics: human-readable text, then JSON for tool consumption
  if (opts.metricsJson) {
    out << metrics.summaryJson();
  } else if (opts.metrics || use_env_metrics()) {
    out << metrics.summaryText();
    out << metrics.summaryJson();
  }
  return kExitOk;
}

} // namespace setalg
