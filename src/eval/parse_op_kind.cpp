/***
 * Name: setalg::eval::parseOpKind
 * Purpose: Look up an operation by its command line name.
 */
#include "setalg/eval/Evaluator.h"
#include "setalg/eval/detail/OpTable.h"

#include <optional>
#include <string_view>

namespace setalg::eval {

std::optional<OpKind> parseOpKind(std::string_view name) {
  for (const auto& [spelling, kind] : detail::kOpTable) {
    if (spelling == name) { return kind; }
  }
  return std::nullopt;
}

} // namespace setalg::eval
