/***
 * Name: setalg::support (parse_util)
 * Purpose: View-returning helpers shared by the integer and operand parsers.
 * Inputs: std::string_view text
 * Outputs: Narrowed views, sign flags, field lists and status booleans
 * Theory of Operation: Nothing here allocates except SplitFields' vector;
 *   all views alias the caller's buffer.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace setalg {
namespace support {

/*** TrimSpaces: `text` without leading or trailing ASCII whitespace. */
std::string_view TrimSpaces(std::string_view text);

/*** StripSign: `text` after an optional leading '+' or '-'; is_negative reports a '-'. */
std::string_view StripSign(std::string_view text, bool& is_negative);

/***
 * SplitFields: fields of `text` separated by `sep`, each trimmed. Blank text
 * has no fields; "1,,2" has an empty middle field.
 */
std::vector<std::string_view> SplitFields(std::string_view text, char sep);

/***
 * ParseDigitsStrict: Parse contiguous base-10 digits into a magnitude no
 * larger than `limit`; trailing whitespace is allowed, anything else after
 * the digits is an error.
 */
bool ParseDigitsStrict(std::string_view text, uint64_t limit, uint64_t& value, std::string* err);

}  // namespace support
}  // namespace setalg
