#pragma once

#include <string>

namespace setalg::cli {

    // Help text printed for -h/--help and after argument errors.
    std::string Usage();

} // namespace setalg::cli
