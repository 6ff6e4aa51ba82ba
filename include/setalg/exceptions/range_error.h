/***
 * Name: setalg::exceptions::RangeError
 * Purpose: Raised by StepRange for a zero step, or for a progression with more
 *   elements than std::size_t can count.
 */
#pragma once

#include <string>
#include <utility>

#include "setalg/exceptions/setalg_exception.h"

namespace setalg::exceptions {

class RangeError : public SetalgException {
 public:
  explicit RangeError(std::string msg) noexcept : SetalgException(std::move(msg)) {}
};

} // namespace setalg::exceptions
