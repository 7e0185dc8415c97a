/***
 * Name: test_metrics
 * Purpose: Metrics timers, counters, hints and summaries.
 */
#include <gtest/gtest.h>
#include <string>
#include "observability/Metrics.h"

using namespace exprguard;

TEST(ObservabilityMetrics, TimersAccumulatePerStage) {
  obs::Metrics m;
  m.start("extract");
  m.stop("extract");
  m.start("extract");
  m.stop("extract");
  m.stop("validate"); // never started: ignored
  ASSERT_EQ(m.durationsUs().size(), 1u);
  EXPECT_EQ(m.durationsUs().count("extract"), 1u);
}

TEST(ObservabilityMetrics, CountersAndHints) {
  obs::Metrics m;
  EXPECT_EQ(m.counter("checks"), 0u);
  m.incCounter("checks");
  m.incCounter("checks", 2);
  m.setCounter("statements", 4);
  EXPECT_EQ(m.counter("checks"), 3u);
  EXPECT_EQ(m.counter("statements"), 4u);
  EXPECT_TRUE(m.hints().empty());

  m.setCounter("violations.arity", 0);
  EXPECT_TRUE(m.hints().empty());
  m.incCounter("violations.arity");
  ASSERT_EQ(m.hints().size(), 1u);
  EXPECT_EQ(m.hints()[0], "violations_present");

  m.setAstGeometry(obs::AstGeometry{6000, 12});
  ASSERT_EQ(m.hints().size(), 2u);
  EXPECT_EQ(m.hints()[1], "large_ast");
}

TEST(ObservabilityMetrics, TextSummary) {
  obs::Metrics m;
  m.setAstGeometry(obs::AstGeometry{7, 3});
  m.setCounter("call_sites", 2);
  const auto text = m.summaryText();
  EXPECT_EQ(text.rfind("== Metrics ==\n", 0), 0u);
  EXPECT_NE(text.find("  AST: nodes=7, max_depth=3\n"), std::string::npos);
  EXPECT_NE(text.find("  call_sites = 2\n"), std::string::npos);
}

TEST(ObservabilityMetrics, JsonSummary) {
  obs::Metrics m;
  EXPECT_EQ(m.summaryJson(), "{\n  \"durations_ms\": {}\n}\n");
  m.start("Extract");
  m.stop("Extract");
  m.setCounter("violations.vector_scope", 1);
  const auto json = m.summaryJson();
  EXPECT_NE(json.find("\"extract\": "), std::string::npos);
  EXPECT_NE(json.find("\"counters\": {\n    \"violations.vector_scope\": 1\n  }"), std::string::npos);
  EXPECT_NE(json.find("\"hints\": [\"violations_present\"]"), std::string::npos);
}

TEST(ObservabilityMetrics, ResetClearsEverything) {
  obs::Metrics m;
  m.start("extract");
  m.stop("extract");
  m.incCounter("checks");
  m.setAstGeometry(obs::AstGeometry{1, 1});
  m.reset();
  EXPECT_TRUE(m.durationsUs().empty());
  EXPECT_TRUE(m.counters().empty());
  EXPECT_FALSE(m.astGeometry().has_value());
}
