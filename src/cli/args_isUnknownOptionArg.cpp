#include "setalg/cli/ParseArgsInternals.h"

#include <cctype>

namespace setalg::cli::detail {
    /***
     * Name: setalg::cli::detail::isUnknownOptionArg
     * Purpose: Detect unsupported option-like arguments that start with '-'.
     *          "-3:5" and "-1,2" are operands, not options.
     */
    bool isUnknownOptionArg(const std::string_view arg) {
        if (arg.empty() || arg[0] != '-') { return false; }
        return arg.size() < 2 || std::isdigit(static_cast<unsigned char>(arg[1])) == 0;
    }
} // namespace setalg::cli::detail
