/***
 * Name: test_evaluate
 * Purpose: Verify operation lookup, dispatch over operand kinds, arity checks and metrics.
 */
#include <gtest/gtest.h>
#include <string>
#include <variant>
#include <vector>
#include "setalg/eval/Evaluator.h"
#include "setalg/exceptions/config_error.h"
#include "setalg/observability/Metrics.h"

using namespace setalg::eval;

namespace {

std::vector<Operand> parseAll(const std::vector<std::string>& texts) {
  std::vector<Operand> out;
  for (const auto& text : texts) { out.push_back(parseOperand(text)); }
  return out;
}

std::string run(OpKind op, const std::vector<std::string>& texts) {
  return formatResult(evaluate(op, parseAll(texts)));
}

} // namespace

TEST(Evaluate, OperationNames) {
  for (const char* name : {"union", "intersect", "setdiff", "symdiff", "issubset", "issuperset", "psubset",
                           "psuperset", "issetequal", "isdisjoint"}) {
    const auto op = parseOpKind(name);
    ASSERT_TRUE(op.has_value()) << name;
    EXPECT_EQ(opName(*op), name);
  }
  EXPECT_FALSE(parseOpKind("merge").has_value());
  EXPECT_TRUE(isPredicate(OpKind::IsDisjoint));
  EXPECT_FALSE(isPredicate(OpKind::SymDiff));
}

TEST(Evaluate, FirstOperandDecidesResultKind) {
  EXPECT_EQ(run(OpKind::Union, {"[3,1,3]", "{2}"}), "[3, 1, 2]");
  EXPECT_EQ(run(OpKind::Union, {"{3,1}", "[2]"}), "{1, 2, 3}");
  EXPECT_EQ(run(OpKind::Union, {"1:3"}), "[1, 2, 3]");
}

TEST(Evaluate, ConstructionOperations) {
  EXPECT_EQ(run(OpKind::Intersect, {"[5,1,5,2]", "1:2"}), "[1, 2]");
  EXPECT_EQ(run(OpKind::Intersect, {"{1,2,3}", "{2,3}", "[3]"}), "{3}");
  EXPECT_EQ(run(OpKind::SetDiff, {"{1,2,3}", "2:3"}), "{1}");
  EXPECT_EQ(run(OpKind::SymDiff, {"[1,2]", "[2,3]"}), "[1, 3]");
  EXPECT_EQ(run(OpKind::Union, {"1", "2", "3", "4"}), "[1, 2, 3, 4]");
}

TEST(Evaluate, Predicates) {
  EXPECT_EQ(run(OpKind::IsSubset, {"[1,1]", "{1,2}"}), "true");
  EXPECT_EQ(run(OpKind::IsSuperset, {"[1,1]", "{1,2}"}), "false");
  EXPECT_EQ(run(OpKind::ProperSubset, {"{1}", "1:2"}), "true");
  EXPECT_EQ(run(OpKind::ProperSuperset, {"{1,2}", "[1,2]"}), "false");
  EXPECT_EQ(run(OpKind::IsSetEqual, {"[2,1,1]", "1:2"}), "true");
  EXPECT_EQ(run(OpKind::IsDisjoint, {"0:2:100", "1:2:101"}), "true");
}

TEST(Evaluate, OperandCountIsChecked) {
  EXPECT_THROW(evaluate(OpKind::IsSubset, parseAll({"1"})), setalg::exceptions::ConfigError);
  EXPECT_THROW(evaluate(OpKind::IsDisjoint, parseAll({"1", "2", "3"})), setalg::exceptions::ConfigError);
  EXPECT_THROW(evaluate(OpKind::Union, {}), setalg::exceptions::ConfigError);
  EXPECT_THROW(evaluate(OpKind::Union, parseAll({"1", "2", "3", "4", "5"})), setalg::exceptions::ConfigError);
  try {
    evaluate(OpKind::IsSubset, parseAll({"1"}));
  } catch (const setalg::exceptions::ConfigError& ex) {
    EXPECT_NE(std::string(ex.what()).find("issubset takes exactly 2 operands, got 1"), std::string::npos);
  }
}

TEST(Evaluate, RecordsMetrics) {
  setalg::obs::Metrics metrics;
  const auto operands = parseAll({"[1,2,3]", "{9}"});
  const Result result = evaluate(OpKind::Intersect, operands, &metrics);
  EXPECT_EQ(formatResult(result), "[]");
  EXPECT_EQ(metrics.counters().at("operands"), 2u);
  EXPECT_EQ(metrics.counters().at("elements.in"), 4u);
  EXPECT_EQ(metrics.counters().at("strategy.direct"), 1u);
  EXPECT_EQ(metrics.counters().at("elements.out"), 0u);
  EXPECT_EQ(metrics.counters().count("range.fastpath"), 0u);

  setalg::obs::Metrics rangeMetrics;
  evaluate(OpKind::IsDisjoint, parseAll({"0:2:10", "1:2:11"}), &rangeMetrics);
  EXPECT_EQ(rangeMetrics.counters().at("range.fastpath"), 1u);
}

TEST(Evaluate, LargeSequenceTargetIsMaterialized) {
  setalg::obs::Metrics metrics;
  std::string big = "[0";
  for (int i = 1; i < 100; ++i) { big += "," + std::to_string(i); }
  big += "]";
  EXPECT_EQ(formatResult(evaluate(OpKind::IsSubset, parseAll({"[5]", big}), &metrics)), "true");
  EXPECT_EQ(metrics.counters().at("strategy.materialize"), 1u);
}

TEST(FormatResult, Shapes) {
  EXPECT_EQ(formatResult(Result{true}), "true");
  EXPECT_EQ(formatResult(Result{Sequence{-1, 2}}), "[-1, 2]");
  EXPECT_EQ(formatResult(Result{Set{2, -1}}), "{-1, 2}");
  EXPECT_EQ(formatResult(Result{Set{}}), "{}");
}
