/***
 * Name: setalg::support::ParseDigitsStrict
 * Purpose: Read an unsigned decimal magnitude no larger than `limit`.
 * Theory of Operation:
 *   The digit run is split from whatever follows it. Trailing blanks are
 *   allowed; any other tail is an error, reported before the magnitude is
 *   range-checked.
 */
#include "setalg/support/parse_util.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace setalg::support {

namespace {

bool fail(std::string* err, const char* why) {
  if (err != nullptr) { *err = why; }
  return false;
}

} // namespace

bool ParseDigitsStrict(std::string_view text, uint64_t limit, uint64_t& value, std::string* err) {
  value = 0;
  const std::size_t digitEnd = std::min(text.find_first_not_of("0123456789"), text.size());
  const std::string_view digits = text.substr(0, digitEnd);
  const std::string_view tail = text.substr(digitEnd);

  if (!tail.empty() && std::isspace(static_cast<unsigned char>(tail.front())) == 0) {
    return fail(err, "invalid character in integer literal");
  }
  if (!TrimSpaces(tail).empty()) { return fail(err, "unexpected characters after integer literal"); }
  if (digits.empty()) { return fail(err, "missing digits in integer literal"); }

  for (const char ch : digits) {
    const auto digit = static_cast<uint64_t>(ch - '0');
    if (digit > limit || value > (limit - digit) / 10) { return fail(err, "integer overflow"); }
    value = value * 10 + digit;
  }
  return true;
}

} // namespace setalg::support
