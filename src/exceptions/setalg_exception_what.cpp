/***
 * Name: setalg::exceptions::SetalgException::what
 * Purpose: Message printed by the tool after its "setalg: " prefix.
 */
#include "setalg/exceptions/setalg_exception.h"

namespace setalg::exceptions {

const char* SetalgException::what() const noexcept {
  return message_.c_str();
}

}  // namespace setalg::exceptions
