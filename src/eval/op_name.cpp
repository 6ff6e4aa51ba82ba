/***
 * Name: setalg::eval::opName
 * Purpose: Command line spelling of an operation, for logs and messages.
 */
#include "setalg/eval/Evaluator.h"
#include "setalg/eval/detail/OpTable.h"

#include <string_view>

namespace setalg::eval {

std::string_view opName(OpKind op) {
  for (const auto& [spelling, kind] : detail::kOpTable) {
    if (kind == op) { return spelling; }
  }
  return "unknown";
}

} // namespace setalg::eval
