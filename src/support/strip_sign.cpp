/***
 * Name: setalg::support::StripSign
 * Purpose: Split an optional sign character off the front of a numeric literal.
 * Inputs: text, is_negative (out)
 * Outputs: the remaining digits view
 */
#include "setalg/support/parse_util.h"

#include <string_view>

namespace setalg {
namespace support {

std::string_view StripSign(std::string_view text, bool& is_negative) {
  is_negative = !text.empty() && text.front() == '-';
  if (!text.empty() && (text.front() == '-' || text.front() == '+')) { text.remove_prefix(1); }
  return text;
}

}  // namespace support
}  // namespace setalg
