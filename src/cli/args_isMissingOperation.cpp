#include "setalg/cli/ParseArgsInternals.h"

namespace setalg::cli::detail {
    /***
     * Name: setalg::cli::detail::isMissingOperation
     * Purpose: An operation is required unless help was requested.
     */
    bool isMissingOperation(const Options &opts) {
        return !opts.showHelp && opts.op.empty();
    }
} // namespace setalg::cli::detail
