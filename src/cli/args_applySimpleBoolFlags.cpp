#include "setalg/cli/ParseArgsInternals.h"

namespace setalg::cli::detail {
    /***
     * Name: setalg::cli::detail::applySimpleBoolFlags
     * Purpose: Handle flag-only boolean options and set outputs.
     */
    bool applySimpleBoolFlags(std::string_view arg, Options &out) {
        if (isFlag(arg, {"-h", "--help"})) {
            out.showHelp = true;
            return true;
        }
        if (isFlag(arg, {"--metrics"})) {
            out.metrics = true;
            return true;
        }
        if (isFlag(arg, {"--metrics-json"})) {
            out.metricsJson = true;
            return true;
        }
        if (isFlag(arg, {"--log-ops"})) {
            out.logOps = true;
            return true;
        }
        return false;
    }
} // namespace setalg::cli::detail
