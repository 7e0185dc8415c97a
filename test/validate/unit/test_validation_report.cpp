/***
 * Name: test_validation_report
 * Purpose: Report ordering, determinism and rendering.
 */
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include "exprguard/exceptions/validation_input_error.h"
#include "extract/Extractor.h"
#include "schema/RuleSchema.h"
#include "validate/Validator.h"

using namespace exprguard;
using validate::Category;

static schema::RuleSchema smallSchema() {
  schema::OperatorTable ops;
  ops["+"] = schema::OperatorConfig{};
  schema::KwargConfig window;
  window.type = "int";
  window.minVal = 1;
  ops["ts_sum"] = schema::OperatorConfig{2, 2, {{"lag", window}}};
  schema::DatafieldTable fields{{"close", "MATRIX"}, {"tgr_price", "VECTOR"}};
  return schema::RuleSchema(ops, fields);
}

TEST(ValidationReport, SortedByCategoryThenPosition) {
  const auto s = smallSchema();
  const auto ex = extract::extract("tgr_price + ts_sum(close, lag=0) + zed + ts_sum(close, 3, bad=1) * foo(close)");
  const auto r = validate::validate(ex, s);
  ASSERT_EQ(r.size(), 7u) << r.toText();
  const auto& v = r.violations();
  EXPECT_EQ(v[0].category, Category::UnknownOperator);
  EXPECT_EQ(v[0].subject, "*");
  EXPECT_EQ(v[1].category, Category::UnknownOperator);
  EXPECT_EQ(v[1].subject, "foo");
  EXPECT_EQ(v[2].category, Category::UnknownDatafield);
  EXPECT_EQ(v[3].category, Category::Arity);
  EXPECT_EQ(*v[3].callIndex, 0u);
  EXPECT_EQ(v[4].category, Category::UnknownKwarg);
  EXPECT_EQ(v[4].keyword, "bad");
  EXPECT_EQ(v[5].category, Category::KwargRange);
  EXPECT_EQ(v[5].detail, "keyword 'lag' of 'ts_sum' must be in [1, inf), got 0");
  EXPECT_EQ(v[6].category, Category::VectorScope);
}

TEST(ValidationReport, EqualInputsGiveEqualReports) {
  const auto s = smallSchema();
  const char* src = "a = foo(close); ts_sum(a, lag=-1) + tgr_price";
  const auto first = validate::validate(extract::extract(src), s);
  const auto second = validate::validate(extract::extract(src), s);
  EXPECT_EQ(first.toJson(), second.toJson());
  EXPECT_EQ(first.toText(), second.toText());
}

TEST(ValidationReport, TextRendering) {
  const auto s = smallSchema();
  EXPECT_EQ(validate::validate(extract::extract("close + close"), s).toText(), "ok\n");
  const auto r = validate::validate(extract::extract("close + zed"), s);
  EXPECT_EQ(r.toText(), "1:9: unknown_datafield: datafield or variable 'zed' is not defined or allowed\n");
}

TEST(ValidationReport, JsonRendering) {
  const auto s = smallSchema();
  const auto empty = validate::validate(extract::extract("close"), s);
  EXPECT_EQ(empty.toJson(), "{\n  \"ok\": true,\n  \"violations\": []\n}\n");

  const auto r = validate::validate(extract::extract("ts_sum(close, 2, bad='x\"y')"), s);
  const auto json = r.toJson();
  EXPECT_NE(json.find("\"ok\": false"), std::string::npos);
  EXPECT_NE(json.find("\"category\": \"unknown_kwarg\""), std::string::npos);
  EXPECT_NE(json.find("\"call_index\": 0"), std::string::npos);
  EXPECT_NE(json.find("\"keyword\": \"bad\""), std::string::npos);
  EXPECT_NE(json.find("\"line\": 1, \"col\": 18"), std::string::npos);
}

TEST(ValidationReport, CountByCategory) {
  const auto s = smallSchema();
  const auto r = validate::validate(extract::extract("p(close) + q(close) + zed"), s);
  EXPECT_EQ(r.count(Category::UnknownOperator), 2u);
  EXPECT_EQ(r.count(Category::UnknownDatafield), 1u);
  EXPECT_EQ(r.count(Category::Arity), 0u);
}

TEST(ValidationReport, MovedFromExtractionIsRejected) {
  const auto s = smallSchema();
  auto ex = extract::extract("close");
  auto taken = std::move(ex);
  EXPECT_TRUE(validate::validate(taken, s).ok());
  EXPECT_THROW(validate::validate(ex, s), exceptions::ValidationInputError);
}
