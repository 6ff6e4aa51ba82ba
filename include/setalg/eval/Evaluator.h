/***
 * Name: setalg::eval
 * Purpose: Evaluate one set operation over integer collection literals.
 * Inputs:
 *   - An operation name and operand literals, as given on the command line.
 * Outputs:
 *   - A Result (bool for predicates, a sequence or a set for construction
 *     operations) and its printed form.
 * Theory of Operation:
 *   Operands are parsed into a variant over the three collection kinds the
 *   tool understands. evaluate() visits the variants and calls the generic
 *   set-algebra templates, so every pairing of kinds goes through the same
 *   dispatch a library user would get. Evaluation statistics are recorded
 *   into an optional Metrics instance.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "setalg/observability/Metrics.h"
#include "setalg/range/StepRange.h"

namespace setalg::eval {

using Int = std::int64_t;
using Sequence = std::vector<Int>;
using Set = std::set<Int>;
using Range = StepRange<Int>;

using Operand = std::variant<Sequence, Set, Range>;
using Result = std::variant<bool, Sequence, Set>;

enum class OpKind {
  Union,
  Intersect,
  SetDiff,
  SymDiff,
  IsSubset,
  IsSuperset,
  ProperSubset,
  ProperSuperset,
  IsSetEqual,
  IsDisjoint,
};

// Construction operations accept up to this many operands.
inline constexpr std::size_t kMaxOperands = 4;

/*** parseOpKind: map a command line operation name to its kind; nullopt when unknown. */
std::optional<OpKind> parseOpKind(std::string_view name);

/*** opName: command line spelling of an operation. */
std::string_view opName(OpKind op);

/*** isPredicate: true for the operations that answer true/false. */
bool isPredicate(OpKind op);

/***
 * parseOperand: parse `[1,2]`, `1,2`, `{1,2}`, `a:b` or `a:s:b`.
 * Throws exceptions::ParseError on malformed text and exceptions::RangeError
 * on a zero step.
 */
Operand parseOperand(std::string_view text);

/***
 * evaluate: apply `op` to the operands. Predicates take exactly two operands,
 * construction operations between one and kMaxOperands; other counts throw
 * exceptions::ConfigError.
 */
Result evaluate(OpKind op, const std::vector<Operand>& operands, obs::Metrics* metrics = nullptr);

/*** formatResult: `true`/`false`, `[a, b]` for sequences, `{a, b}` for sets. */
std::string formatResult(const Result& result);

} // namespace setalg::eval
