/***
 * Name: setalg::eval::evaluate
 * Purpose: Apply one operation to parsed operands.
 * Inputs:
 *   - op: operation kind
 *   - operands: parsed collections
 *   - metrics: optional sink for evaluation counters
 * Outputs:
 *   - Result: bool for predicates, Sequence or Set for construction operations
 * Theory of Operation:
 *   The operand variants are visited one at a time, accumulating the
 *   concrete alternatives as a parameter pack, and the generic template is
 *   called once the pack is complete. The first operand decides the result
 *   kind exactly as it does for library callers: a Set stays a Set, a
 *   Sequence or Range gives a Sequence.
 */
#include "setalg/algebra/Disjoint.h"
#include "setalg/algebra/FastIn.h"
#include "setalg/algebra/Intersect.h"
#include "setalg/algebra/SetDiff.h"
#include "setalg/algebra/SetEqual.h"
#include "setalg/algebra/Subset.h"
#include "setalg/algebra/SymDiff.h"
#include "setalg/algebra/Union.h"
#include "setalg/eval/Evaluator.h"
#include "setalg/exceptions/config_error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace setalg::eval {

namespace {

template <typename Fn, typename... Done>
Result applyConstruction(const Fn& fn, std::span<const Operand> rest, const Done&... done) {
  if constexpr (sizeof...(Done) > 0) {
    if (rest.empty()) { return Result{fn(done...)}; }
  }
  if constexpr (sizeof...(Done) < kMaxOperands) {
    return std::visit(
        [&fn, rest, &done...](const auto& next) { return applyConstruction(fn, rest.subspan(1), done..., next); },
        rest.front());
  } else {
    throw exceptions::ConfigError("too many operands");
  }
}

template <typename Fn>
bool applyPredicate(const Fn& fn, const std::vector<Operand>& operands) {
  return std::visit([&fn](const auto& a, const auto& b) { return fn(a, b); }, operands[0], operands[1]);
}

Result dispatch(OpKind op, const std::vector<Operand>& operands) {
  const std::span<const Operand> all(operands);
  switch (op) {
    case OpKind::Union:
      return applyConstruction([](const auto&... xs) { return unite(xs...); }, all);
    case OpKind::Intersect:
      return applyConstruction([](const auto&... xs) { return intersect(xs...); }, all);
    case OpKind::SetDiff:
      return applyConstruction([](const auto&... xs) { return setdiff(xs...); }, all);
    case OpKind::SymDiff:
      return applyConstruction([](const auto&... xs) { return symdiff(xs...); }, all);
    case OpKind::IsSubset:
      return applyPredicate(IsSubsetFn{}, operands);
    case OpKind::IsSuperset:
      return applyPredicate(IsSupersetFn{}, operands);
    case OpKind::ProperSubset:
      return applyPredicate(IsProperSubsetFn{}, operands);
    case OpKind::ProperSuperset:
      return applyPredicate(IsProperSupersetFn{}, operands);
    case OpKind::IsSetEqual:
      return applyPredicate(IsSetEqualFn{}, operands);
    case OpKind::IsDisjoint:
      return applyPredicate(IsDisjointFn{}, operands);
  }
  throw exceptions::ConfigError("unsupported operation");
}

void checkOperandCount(OpKind op, std::size_t count) {
  if (isPredicate(op)) {
    if (count != 2) {
      throw exceptions::ConfigError(std::string(opName(op)) + " takes exactly 2 operands, got " + std::to_string(count));
    }
    return;
  }
  if (count == 0 || count > kMaxOperands) {
    throw exceptions::ConfigError(std::string(opName(op)) + " takes 1 to " + std::to_string(kMaxOperands) +
                                  " operands, got " + std::to_string(count));
  }
}

// The operands probed by membership tests; the superset forms probe their first operand.
bool isMembershipTarget(OpKind op, std::size_t index) {
  if (op == OpKind::IsSuperset || op == OpKind::ProperSuperset) { return index == 0; }
  return index > 0;
}

void recordInputs(OpKind op, const std::vector<Operand>& operands, obs::Metrics& metrics) {
  metrics.setCounter("operands", static_cast<uint64_t>(operands.size()));
  for (std::size_t i = 0; i < operands.size(); ++i) {
    std::visit(
        [&](const auto& x) {
          metrics.incCounter("elements.in", static_cast<uint64_t>(length(x)));
          if (!isMembershipTarget(op, i)) { return; }
          const bool materialize = membershipStrategy(x) == MembershipStrategy::Materialize;
          metrics.incCounter(materialize ? "strategy.materialize" : "strategy.direct");
        },
        operands[i]);
  }
  if (op == OpKind::IsDisjoint && std::holds_alternative<Range>(operands[0]) &&
      std::holds_alternative<Range>(operands[1])) {
    metrics.incCounter("range.fastpath");
  }
}

void recordOutput(const Result& result, obs::Metrics& metrics) {
  std::visit(
      [&metrics](const auto& value) {
        if constexpr (!std::is_same_v<std::decay_t<decltype(value)>, bool>) {
          metrics.setCounter("elements.out", static_cast<uint64_t>(value.size()));
        }
      },
      result);
}

} // namespace

Result evaluate(OpKind op, const std::vector<Operand>& operands, obs::Metrics* metrics) {
  checkOperandCount(op, operands.size());
  if (metrics != nullptr) { recordInputs(op, operands, *metrics); }
  Result result = dispatch(op, operands);
  if (metrics != nullptr) { recordOutput(result, *metrics); }
  return result;
}

} // namespace setalg::eval
