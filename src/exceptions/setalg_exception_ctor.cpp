/***
 * Name: setalg::exceptions::SetalgException::SetalgException
 * Purpose: Shared constructor of the concrete setalg error kinds.
 * Inputs:
 *   - msg: complete message, already formatted by the derived class or throw site
 */
#include "setalg/exceptions/setalg_exception.h"

#include <string>
#include <utility>

namespace setalg::exceptions {

SetalgException::SetalgException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace setalg::exceptions
