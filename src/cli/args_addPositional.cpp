#include "setalg/cli/ParseArgsInternals.h"

#include <string>

namespace setalg::cli::detail {

/***
 * Name: setalg::cli::detail::addPositional
 * Purpose: Route a positional argument to the operation name or the operand list.
 */
void addPositional(std::string_view arg, Options& out) {
    if (out.op.empty()) {
        out.op = std::string(arg);
        return;
    }
    out.operands.emplace_back(arg);
}

} // namespace setalg::cli::detail
