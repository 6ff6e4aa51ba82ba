/***
 * Name: setalg::exceptions::ConfigError
 * Purpose: The request itself is unusable: an operation name the evaluator does
 *   not know, or an operand count the operation cannot take.
 * Theory of Operation: The tool maps it to the usage exit code, unlike the
 *   other SetalgException types.
 */
#pragma once

#include <string>
#include <utility>

#include "setalg/exceptions/setalg_exception.h"

namespace setalg::exceptions {

class ConfigError : public SetalgException {
 public:
  explicit ConfigError(std::string msg) noexcept : SetalgException(std::move(msg)) {}
};

} // namespace setalg::exceptions
