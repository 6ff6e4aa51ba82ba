/***
 * Name: setalg::eval::parseOperand
 * Purpose: Parse one collection literal from the command line.
 * Inputs:
 *   - text: `[1,2,3]`, `1,2,3`, `{1,2,3}`, `a:b` or `a:s:b`
 * Outputs:
 *   - Operand holding a Sequence, a Set or a Range.
 * Theory of Operation:
 *   The bracket kind (or a ':' for ranges) selects the collection kind.
 *   Elements are comma separated 64-bit integers parsed with
 *   support::ParseInt64Strict; spaces around elements are ignored.
 */
#include "setalg/eval/Evaluator.h"
#include "setalg/exceptions/parse_error.h"
#include "setalg/support/parse.h"
#include "setalg/support/parse_util.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace setalg::eval {

namespace {

[[noreturn]] void fail(std::string_view literal, const std::string& why) {
  throw exceptions::ParseError(std::string(literal), why);
}

Int parseElement(std::string_view item, std::string_view literal) {
  Int value = 0;
  std::string err;
  if (!support::ParseInt64Strict(item, value, &err)) { fail(literal, err); }
  return value;
}

std::vector<Int> parseElements(std::string_view body, std::string_view literal) {
  std::vector<Int> out;
  for (const auto item : support::SplitFields(body, ',')) { out.push_back(parseElement(item, literal)); }
  return out;
}

Range parseRange(std::string_view body, std::string_view literal) {
  const auto parts = support::SplitFields(body, ':');
  if (parts.size() == 2) {
    return unitRange(parseElement(parts[0], literal), parseElement(parts[1], literal));
  }
  if (parts.size() == 3) {
    return Range(parseElement(parts[0], literal), parseElement(parts[1], literal), parseElement(parts[2], literal));
  }
  fail(literal, "range needs the form a:b or a:step:b");
}

} // namespace

Operand parseOperand(std::string_view text) {
  const std::string_view literal = text;
  text = support::TrimSpaces(text);
  if (text.empty()) { fail(literal, "empty operand"); }
  if (text.front() == '[' || text.front() == '{') {
    const char close = text.front() == '[' ? ']' : '}';
    if (text.size() < 2 || text.back() != close) { fail(literal, std::string("missing closing '") + close + "'"); }
    auto elements = parseElements(text.substr(1, text.size() - 2), literal);
    if (close == ']') { return Operand{std::move(elements)}; }
    return Operand{Set(elements.begin(), elements.end())};
  }
  if (text.find(':') != std::string_view::npos) { return Operand{parseRange(text, literal)}; }
  return Operand{parseElements(text, literal)};
}

} // namespace setalg::eval
