#include "setalg/cli/ParseArgsInternals.h"

#include <span>

namespace setalg::cli::detail {

/***
 * Name: setalg::cli::detail::collectRemainingAsInputs
 * Purpose: After `--`, options are no longer recognised; "-5" and "--metrics" become positionals.
 */
void collectRemainingAsInputs(std::span<char* const> rest, Options& out) {
  for (const char* arg : rest) { addPositional(arg, out); }
}

} // namespace setalg::cli::detail
