#include "setalg/cli/ParseArgs.h"
#include "setalg/cli/Options.h"
#include "setalg/cli/ParseArgsInternals.h"
#include <cstddef>
#include <iostream>
#include <span>
#include <string_view>

namespace setalg::cli {
    /***
     * Name: setalg::cli::ParseArgs
     * Purpose: Parse `setalg [options] <op> <operand>...` into Options.
     * Theory of Operation:
     *   Options may appear anywhere before `--`. The first positional names the
     *   operation and the rest are operands; a '-' followed by a digit is a
     *   negative operand, never an option.
     */
    bool ParseArgs(const int argc, char **argv, Options &out, std::ostream &diag) {
        const std::span<char *const> args(argv, static_cast<std::size_t>(argc));
        for (std::size_t i = 1; i < args.size(); ++i) {
            const std::string_view arg{args[i]};
            if (detail::isFlag(arg, {"--"})) {
                detail::collectRemainingAsInputs(args.subspan(i + 1), out);
                break;
            }
            if (detail::applySimpleBoolFlags(arg, out) || detail::applyPrefixedOptions(arg, out)) { continue; }
            if (detail::isUnknownOptionArg(arg)) {
                diag << "setalg: unknown option '" << arg << "'\n";
                return false;
            }
            detail::addPositional(arg, out);
        }

        if (detail::isMissingOperation(out)) {
            diag << "setalg: no operation given\n";
            return false;
        }
        return true;
    }

    bool ParseArgs(const int argc, char **argv, Options &out) { return ParseArgs(argc, argv, out, std::cerr); }
} // namespace setalg::cli
