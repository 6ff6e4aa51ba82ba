#ifndef SETALG_TOOL_TOOL_H
#define SETALG_TOOL_TOOL_H

/***
 * Name: setalg::Tool
 * Purpose: Run one command line evaluation end-to-end.
 * Inputs:
 *   - CLI options
 *   - Output and diagnostic streams
 * Outputs:
 *   - Printed result, optional metrics and ops log; exit code
 * Theory of Operation:
 *   Parses the operation and operands, evaluates them under the Parse and
 *   Evaluate timers, prints the result and then any requested metrics.
 *   Usage errors (unknown operation, wrong operand count) exit with 2,
 *   malformed operands with 1.
 */

#include <iosfwd>

// Forward declarations to reduce header coupling
namespace setalg { namespace cli { struct Options; } }

namespace setalg {
    inline constexpr int kExitOk = 0;
    inline constexpr int kExitEvalError = 1;
    inline constexpr int kExitUsage = 2;

    class Tool {
    public:
        static int run(const cli::Options &opts, std::ostream &out, std::ostream &err);

        // SETALG_METRICS=1|true|yes turns on --metrics.
        static bool use_env_metrics();
    };
} // namespace setalg

#endif // SETALG_TOOL_TOOL_H
