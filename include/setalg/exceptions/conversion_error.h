/***
 * Name: setalg::exceptions::ConversionError
 * Purpose: An element cannot be stored in an integral destination without
 *   changing its value (2.5 into a set of int, 300 into a vector of int8_t).
 */
#pragma once

#include <string>
#include <utility>

#include "setalg/exceptions/setalg_exception.h"

namespace setalg::exceptions {

class ConversionError : public SetalgException {
 public:
  explicit ConversionError(std::string msg) noexcept : SetalgException(std::move(msg)) {}
};

} // namespace setalg::exceptions
