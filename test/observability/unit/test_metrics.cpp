/***
 * Name: test_metrics
 * Purpose: Validate stage timing, counters, summaries and hints.
 */
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include "setalg/observability/Metrics.h"

using setalg::obs::Metrics;

TEST(ObservabilityMetrics, StopWithoutStartIsIgnored) {
  Metrics m;
  m.stop("Evaluate");
  EXPECT_TRUE(m.durations().empty());
}

TEST(ObservabilityMetrics, StagesAccumulate) {
  Metrics m;
  m.start("Parse");
  m.stop("Parse");
  m.start("Parse");
  m.stop("Parse");
  ASSERT_EQ(m.durations().count("Parse"), 1u);
  const std::string text = m.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  Parse: "), std::string::npos);
  EXPECT_NE(m.summaryJson().find("\"parse\": "), std::string::npos);
}

TEST(ObservabilityMetrics, CountersAndGauges) {
  Metrics m;
  m.incCounter("elements.in", 3);
  m.incCounter("elements.in");
  m.setCounter("operands", 2);
  m.setGauge("depth", 7);
  EXPECT_EQ(m.counters().at("elements.in"), 4u);
  EXPECT_EQ(m.counters().at("operands"), 2u);
  EXPECT_EQ(m.gauges().at("depth"), 7u);
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"counters\": {"), std::string::npos);
  EXPECT_NE(json.find("\"elements.in\": 4"), std::string::npos);
  EXPECT_NE(json.find("\"gauges\": {"), std::string::npos);
  EXPECT_NE(m.summaryText().find("  operands = 2\n"), std::string::npos);
}

TEST(ObservabilityMetrics, Hints) {
  Metrics m;
  EXPECT_TRUE(m.hints().empty());
  EXPECT_EQ(m.summaryJson().find("\"hints\""), std::string::npos);
  m.incCounter("strategy.materialize");
  m.setCounter("elements.out", 0);
  const auto hs = m.hints();
  ASSERT_EQ(hs.size(), 2u);
  EXPECT_EQ(hs[0], "aux_set_materialized");
  EXPECT_EQ(hs[1], "empty_result");
  EXPECT_NE(m.summaryJson().find("\"hints\": [\"aux_set_materialized\", \"empty_result\"]"), std::string::npos);
}

TEST(ObservabilityMetrics, ScopedStageStopsOnThrow) {
  Metrics m;
  try {
    Metrics::Stage stage(m, "Evaluate");
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(m.durations().count("Evaluate"), 1u);
  EXPECT_NE(m.summaryJson().find("\"evaluate\": "), std::string::npos);
}
