/***
 * Name: setalg::support::ParseInt64Strict
 * Purpose: Read one signed decimal element of a collection literal.
 * Outputs: true and `out_val` on success; false and `*err` (when given) otherwise.
 * Theory of Operation: Surrounding blanks and a single sign are accepted. The
 *   magnitude limit depends on the sign, so -9223372036854775808 parses.
 */
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace setalg::support {

bool ParseInt64Strict(std::string_view text, int64_t& out_val, std::string* err = nullptr);

} // namespace setalg::support
