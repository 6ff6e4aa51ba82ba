/***
 * Name: setalg::support::TrimSpaces
 * Purpose: Narrow a view to its non-whitespace core.
 * Inputs: text
 * Outputs: sub-view of text; empty when text is blank
 */
#include "setalg/support/parse_util.h"

#include <cctype>
#include <cstddef>
#include <string_view>

namespace setalg {
namespace support {

namespace {
bool isSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
}  // namespace

std::string_view TrimSpaces(std::string_view text) {
  std::size_t first = 0;
  std::size_t last = text.size();
  while (first < last && isSpace(text[first])) { ++first; }
  while (last > first && isSpace(text[last - 1])) { --last; }
  return text.substr(first, last - first);
}

}  // namespace support
}  // namespace setalg
