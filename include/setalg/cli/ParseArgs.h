/***
 * Name: setalg::cli::ParseArgs
 * Purpose: Turn `setalg [options] <op> <operand>...` into Options.
 * Outputs: false when the command line cannot be used; the reason is written to `diag`.
 */
#pragma once

#include <iosfwd>

#include "setalg/cli/Options.h"

namespace setalg::cli {

bool ParseArgs(int argc, char** argv, Options& out, std::ostream& diag);

// Reports to std::cerr.
bool ParseArgs(int argc, char** argv, Options& out);

} // namespace setalg::cli
