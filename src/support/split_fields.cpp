/***
 * Name: setalg::support::SplitFields
 * Purpose: Break a separator-delimited list into trimmed fields.
 * Inputs:
 *   - text: the list body, e.g. "1, 2,3" or "0:2:10"
 *   - sep: the field separator
 * Outputs:
 *   - views into text, one per field; no fields for blank text
 */
#include "setalg/support/parse_util.h"

#include <cstddef>
#include <string_view>
#include <vector>

namespace setalg {
namespace support {

std::vector<std::string_view> SplitFields(std::string_view text, char sep) {
  std::vector<std::string_view> fields;
  text = TrimSpaces(text);
  if (text.empty()) { return fields; }
  std::size_t begin = 0;
  while (true) {
    const std::size_t end = text.find(sep, begin);
    fields.push_back(TrimSpaces(text.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin)));
    if (end == std::string_view::npos) { break; }
    begin = end + 1;
  }
  return fields;
}

}  // namespace support
}  // namespace setalg
