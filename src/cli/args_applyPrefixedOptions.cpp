#include "setalg/cli/ParseArgsInternals.h"

#include <string>

namespace setalg::cli::detail {
    /***
     * Name: setalg::cli::detail::applyPrefixedOptions
     * Purpose: Parse and apply --key=value options.
     */
    bool applyPrefixedOptions(std::string_view arg, Options &out) {
        if (constexpr std::string_view logPathPrefix{"--log-path="}; arg.rfind(logPathPrefix, 0) == 0) {
            const auto value = arg.substr(logPathPrefix.size());
            out.logPath = value.empty() ? std::string(".") : std::string(value);
            return true;
        }
        return false;
    }
} // namespace setalg::cli::detail
