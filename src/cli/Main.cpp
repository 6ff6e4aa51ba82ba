#include "setalg/cli/ParseArgs.h"
#include "setalg/cli/Usage.h"
#include "setalg/tool/Tool.h"
#include <exception>
#include <iostream>
/***
 * Name: setalg::main
 * Purpose: CLI entry point for the setalg tool.
 * Inputs:
 *   - argv
 * Outputs:
 *   - Exit status
 * Theory of Operation:
 *   Parse args then invoke Tool::run.
 */
int main(const int argc, char** argv) {
  try {
    setalg::cli::Options opts;
    if (!setalg::cli::ParseArgs(argc, argv, opts)) {
      std::cerr << "setalg: argument parse error\n";
      std::cerr << setalg::cli::Usage();
      return setalg::kExitUsage;
    }
    if (opts.showHelp) {
      std::cout << setalg::cli::Usage();
      return setalg::kExitOk;
    }
    return setalg::Tool::run(opts, std::cout, std::cerr);
  } catch (const std::exception& ex) {
    std::cerr << "setalg: unhandled exception: " << ex.what() << "\n";
    return setalg::kExitEvalError;
  }
}
