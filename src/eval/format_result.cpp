/***
 * Name: setalg::eval::formatResult
 * Purpose: Render a Result the way the tool prints it.
 */
#include "setalg/eval/Evaluator.h"

#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace setalg::eval {

namespace {

template <typename C>
void appendElements(std::ostringstream& oss, const C& elements, char open, char close) {
  oss << open;
  bool first = true;
  for (const auto value : elements) {
    if (!first) { oss << ", "; }
    first = false;
    oss << value;
  }
  oss << close;
}

} // namespace

std::string formatResult(const Result& result) {
  std::ostringstream oss;
  std::visit(
      [&oss](const auto& value) {
        using V = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<V, bool>) {
          oss << (value ? "true" : "false");
        } else if constexpr (std::is_same_v<V, Sequence>) {
          appendElements(oss, value, '[', ']');
        } else {
          appendElements(oss, value, '{', '}');
        }
      },
      result);
  return oss.str();
}

} // namespace setalg::eval
