/***
 * Name: setalg::exceptions::SetalgException
 * Purpose: Common base of RangeError, ParseError and ConfigError.
 * Theory of Operation:
 *   Only subclasses are thrown, so the constructor is protected. The
 *   set-algebra templates raise nothing of their own; whatever element
 *   comparison or a container primitive throws passes through unchanged.
 */
#pragma once

#include <exception>
#include <string>

namespace setalg::exceptions {

class SetalgException : public std::exception {
 public:
  const char* what() const noexcept override;

 protected:
  explicit SetalgException(std::string msg) noexcept;

 private:
  std::string message_;
};

} // namespace setalg::exceptions
