/**
 * @file
 * @brief Declarations for setalg CLI argument parsing helpers.
 */
#pragma once

#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "setalg/cli/Options.h"

namespace setalg::cli::detail {

/** Return true if `arg` exactly matches one of the flag's spellings. */
bool isFlag(std::string_view arg, std::initializer_list<std::string_view> spellings);

/** Store a positional argument: the first one names the operation, the rest are operands. */
void addPositional(std::string_view arg, Options& out);

/** Store every argument after `--` as a positional, even when it starts with '-'. */
void collectRemainingAsInputs(std::span<char* const> rest, Options& out);

/** Detect unknown option-like arguments; a '-' followed by a digit is a negative operand. */
bool isUnknownOptionArg(std::string_view arg);

/** True when no operation was given and help was not requested. */
bool isMissingOperation(const Options& opts);

/** Handle boolean, flag-only options like -h, --metrics, --log-ops. */
bool applySimpleBoolFlags(std::string_view arg, Options& out);

/** Handle `--key=value` style options (log-path). */
bool applyPrefixedOptions(std::string_view arg, Options& out);

} // namespace setalg::cli::detail
