/***
 * Name: setalg::support::ParseInt64Strict
 * Purpose: Parse a base-10 64-bit integer without throwing; fail on extra tokens.
 * Inputs:
 *   - text: string view of the literal
 * Outputs:
 *   - out_val: parsed integer on success
 *   - err: optional error message on failure
 * Theory of Operation: The magnitude is parsed unsigned against a limit that
 *   depends on the sign, so INT64_MIN parses without overflow.
 */
#include "setalg/support/parse.h"
#include "setalg/support/parse_util.h"

#include <cctype>
#include <cstdint>
#include <limits>

namespace setalg::support {

auto ParseInt64Strict(std::string_view text, int64_t& out_val, std::string* err) -> bool {
  bool is_negative = false;
  const std::string_view digits = StripSign(TrimSpaces(text), is_negative);
  if (digits.empty() || std::isdigit(static_cast<unsigned char>(digits.front())) == 0) {
    if (err != nullptr) {
      *err = "invalid integer literal";
    }
    return false;
  }
  constexpr auto kMaxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
  const uint64_t limit = is_negative ? kMaxPositive + 1 : kMaxPositive;
  uint64_t magnitude = 0;
  if (!ParseDigitsStrict(digits, limit, magnitude, err)) {
    return false;
  }
  out_val = is_negative ? static_cast<int64_t>(uint64_t{0} - magnitude) : static_cast<int64_t>(magnitude);
  return true;
}

}  // namespace setalg::support
