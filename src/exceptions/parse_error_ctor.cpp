/***
 * Name: setalg::exceptions::ParseError::ParseError
 * Purpose: Build the operand error message around the rejected literal.
 */
#include "setalg/exceptions/parse_error.h"

#include <string>
#include <utility>

namespace setalg::exceptions {

ParseError::ParseError(std::string literal, const std::string& reason)
    : SetalgException("invalid operand '" + literal + "': " + reason), literal_(std::move(literal)) {}

}  // namespace setalg::exceptions
