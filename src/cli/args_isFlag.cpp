#include "setalg/cli/ParseArgsInternals.h"

#include <algorithm>

namespace setalg::cli::detail {
    /***
     * Name: setalg::cli::detail::isFlag
     * Purpose: True when `arg` is one of the spellings of a flag ("-h", "--help").
     */
    bool isFlag(const std::string_view arg, const std::initializer_list<std::string_view> spellings) {
        return std::find(spellings.begin(), spellings.end(), arg) != spellings.end();
    }
} // namespace setalg::cli::detail
