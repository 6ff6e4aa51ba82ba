#include "setalg/cli/Usage.h"
#include <string>
#include <string_view>
namespace setalg::cli {

namespace {
// Keep help text as a compile-time constant to avoid reallocation work.
constexpr std::string_view kUsageText = R"(setalg [options] <op> <operand>...

Operations:
  union intersect setdiff symdiff          Build a new collection
  issubset issuperset psubset psuperset    Containment predicates
  issetequal isdisjoint                    Equality and disjointness

Operands:
  [1,2,3] or 1,2,3     Ordered sequence (order kept, duplicates allowed)
  {1,2,3}              Set
  a:b or a:s:b         Inclusive range from a to b with step s (default 1)

Options:
  -h, --help           Print this help and exit
  --metrics            Print evaluation metrics summary
  --metrics-json       Print evaluation metrics in JSON
  --log-path=<dir>     Directory where logs are written (default: .)
  --log-ops            Append a trace of the evaluated operation to the log directory
  --                   End of options

Environment:
  SETALG_METRICS=1     Same as --metrics
)";
} // namespace

std::string Usage() { return std::string(kUsageText); }
} // namespace setalg::cli
