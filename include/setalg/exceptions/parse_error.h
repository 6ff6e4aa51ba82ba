/***
 * Name: setalg::exceptions::ParseError
 * Purpose: A collection literal on the command line could not be read.
 * Outputs: what() reads "invalid operand '<literal>': <reason>"; literal() returns the raw text.
 */
#pragma once

#include <string>

#include "setalg/exceptions/setalg_exception.h"

namespace setalg::exceptions {

class ParseError : public SetalgException {
 public:
  ParseError(std::string literal, const std::string& reason);

  const std::string& literal() const noexcept { return literal_; }

 private:
  std::string literal_;
};

} // namespace setalg::exceptions
