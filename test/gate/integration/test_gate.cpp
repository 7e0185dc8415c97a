/***
 * Name: test_gate
 * Purpose: End-to-end extract and validate through the Gate facade.
 */
#include <gtest/gtest.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "exprguard/exprguard.h"

using namespace exprguard;

static std::shared_ptr<const schema::RuleSchema> makeSchema() {
  schema::OperatorTable ops;
  ops["-"] = schema::OperatorConfig{};
  ops[">"] = schema::OperatorConfig{};
  ops["vec_sum"] = schema::OperatorConfig{1, 1, {}};
  schema::KwargConfig hump;
  hump.type = "float";
  hump.minVal = 0;
  hump.maxVal = 1;
  ops["hump"] = schema::OperatorConfig{1, 1, {{"hump", hump}}};
  schema::DatafieldTable fields{{"close", "MATRIX"}, {"open", "MATRIX"}, {"tgr_price", "VECTOR"}};
  return std::make_shared<const schema::RuleSchema>(ops, fields);
}

TEST(GateIntegration, ValidFormulaPasses) {
  Gate gate(makeSchema());
  const auto res = gate.check("price_diff = close - open; is_bullish = price_diff > 0 --> long when the day closed up");
  EXPECT_TRUE(res.ok()) << res.report.toText();
  EXPECT_EQ(res.extraction.operators, (std::vector<std::string>{"-", ">"}));
  EXPECT_EQ(res.extraction.datafields, (std::vector<std::string>{"close", "open"}));
  EXPECT_EQ(res.extraction.boundNames, (std::vector<std::string>{"price_diff", "is_bullish"}));
}

TEST(GateIntegration, ReportsEveryViolation) {
  Gate gate(makeSchema());
  const auto res = gate.check("hump(close, 2, hump=1.5) - tgr_price * volume");
  ASSERT_FALSE(res.ok());
  const auto& r = res.report;
  EXPECT_EQ(r.count(validate::Category::UnknownOperator), 1u);
  EXPECT_EQ(r.count(validate::Category::UnknownDatafield), 1u);
  EXPECT_EQ(r.count(validate::Category::Arity), 1u);
  EXPECT_EQ(r.count(validate::Category::KwargRange), 1u);
  EXPECT_EQ(r.count(validate::Category::VectorScope), 1u);
  EXPECT_EQ(r.size(), 5u);
}

TEST(GateIntegration, MetricsAccumulateAcrossChecks) {
  Gate gate(makeSchema());
  gate.check("vec_sum(tgr_price) > 0");
  gate.check("a = close; b = a - open; b > zed");
  const auto& m = gate.metrics();
  EXPECT_EQ(m.counter("checks"), 2u);
  EXPECT_EQ(m.counter("statements"), 4u);
  EXPECT_EQ(m.counter("call_sites"), 1u);
  EXPECT_EQ(m.counter("violations"), 1u);
  EXPECT_EQ(m.counter("violations.unknown_datafield"), 1u);
  EXPECT_EQ(m.durationsUs().count("extract"), 1u);
  EXPECT_EQ(m.durationsUs().count("validate"), 1u);
  ASSERT_TRUE(m.astGeometry().has_value());
  EXPECT_GT(m.astGeometry()->nodes, 0u);
  EXPECT_NE(m.summaryJson().find("\"hints\": [\"violations_present\"]"), std::string::npos);
}

TEST(GateIntegration, MetricsCanBeDisabled) {
  GateOptions opts;
  opts.metrics = false;
  Gate gate(makeSchema(), opts);
  gate.check("close - open");
  EXPECT_TRUE(gate.metrics().counters().empty());
  EXPECT_TRUE(gate.metrics().durationsUs().empty());
}

TEST(GateIntegration, FailuresAreLoggedAndRethrown) {
  std::ostringstream log;
  GateOptions opts;
  opts.log = &log;
  Gate gate(makeSchema(), opts);
  EXPECT_THROW(gate.check("close -"), exceptions::SyntaxError);
  EXPECT_THROW(gate.check("close[0]"), exceptions::UnsupportedConstruct);
  EXPECT_EQ(gate.metrics().counter("failures"), 2u);
  EXPECT_EQ(gate.metrics().counter("checks"), 0u);
  EXPECT_EQ(log.str().rfind("exprguard: <expr>:1:", 0), 0u);
  EXPECT_NE(log.str().find("subscript is not supported in expressions"), std::string::npos);
}

TEST(GateIntegration, TokenAndAstDumps) {
  std::ostringstream log;
  GateOptions opts;
  opts.log = &log;
  opts.logTokens = true;
  opts.logAst = true;
  Gate gate(makeSchema(), opts);
  gate.check("close - 1");
  const auto out = log.str();
  EXPECT_NE(out.find("1:1 Ident 'close'\n"), std::string::npos);
  EXPECT_NE(out.find("1:9 Int '1'\n"), std::string::npos);
  EXPECT_NE(out.find("Module\n  ExprStmt\n    BinaryExpr -\n"), std::string::npos);
}

TEST(GateIntegration, ChecksAreDeterministic) {
  Gate gate(makeSchema());
  const char* src = "x = hump(tgr_price, hump='a'); foo(x) > bar";
  EXPECT_EQ(gate.check(src).report.toJson(), gate.check(src).report.toJson());
}

TEST(GateIntegration, SchemaIsSharedBetweenGates) {
  const auto s = makeSchema();
  Gate a(s);
  Gate b(s);
  EXPECT_EQ(&a.schema(), &b.schema());
  EXPECT_EQ(s->operatorCount(), 4u);
}

TEST(GateIntegration, NullSchemaIsRejected) {
  EXPECT_THROW(Gate(nullptr), exceptions::ValidationInputError);
}
