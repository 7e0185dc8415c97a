/***
 * Name: test_extractor
 * Purpose: Operator/datafield extraction, binding rules and call sites.
 */
#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "exprguard/exceptions/exprguard_exception.h"
#include "extract/Extractor.h"

using namespace exprguard;
using Strings = std::vector<std::string>;

TEST(Extractor, PriceDiffExample) {
  auto ex = extract::extract("price_diff = close - open; is_bullish = price_diff > 0");
  EXPECT_EQ(ex.operators, (Strings{"-", ">"}));
  EXPECT_EQ(ex.datafields, (Strings{"close", "open"}));
  EXPECT_EQ(ex.boundNames, (Strings{"price_diff", "is_bullish"}));
  EXPECT_EQ(ex.statementCount(), 2u);
}

TEST(Extractor, DuplicatesCollapseInFirstAppearanceOrder) {
  auto ex = extract::extract("x+x+y");
  EXPECT_EQ(ex.operators, (Strings{"+"}));
  EXPECT_EQ(ex.datafields, (Strings{"x", "y"}));
  EXPECT_EQ(ex.operatorUses.size(), 2u);
  EXPECT_EQ(ex.datafieldUses.size(), 3u);
}

TEST(Extractor, AssignedNamesAreLocalAfterwards) {
  auto ex = extract::extract("a = b; c = a + d");
  EXPECT_EQ(ex.datafields, (Strings{"b", "d"}));
}

TEST(Extractor, SelfReferenceBeforeBindingIsDatafield) {
  auto ex = extract::extract("x = x + 1; y = x");
  EXPECT_EQ(ex.datafields, (Strings{"x"}));
  ASSERT_EQ(ex.datafieldUses.size(), 1u);
  EXPECT_EQ(ex.datafieldUses[0].col, 5);
}

TEST(Extractor, ChainedAssignmentBindsEveryTarget) {
  auto ex = extract::extract("a = b = close; a + b");
  EXPECT_EQ(ex.datafields, (Strings{"close"}));
  EXPECT_EQ(ex.boundNames, (Strings{"a", "b"}));
}

TEST(Extractor, KeywordNamesAreNotDatafields) {
  auto ex = extract::extract("ts_mean(close, d=volume, mode='fast')");
  EXPECT_EQ(ex.operators, (Strings{"ts_mean"}));
  EXPECT_EQ(ex.datafields, (Strings{"close", "volume"}));
  ASSERT_EQ(ex.callSites.size(), 1u);
  const auto& site = ex.callSites[0];
  EXPECT_EQ(site.positional.size(), 1u);
  ASSERT_EQ(site.keywords.size(), 2u);
  EXPECT_EQ(site.keywords[0].name, "d");
  ASSERT_NE(site.findKeyword("mode"), nullptr);
  EXPECT_EQ(site.findKeyword("mode")->col, 26);
  EXPECT_EQ(site.findKeyword("rate"), nullptr);
}

TEST(Extractor, CallSitesArePreOrderIndexed) {
  auto ex = extract::extract("f(g(a), h(b, k(c)))");
  ASSERT_EQ(ex.callSites.size(), 4u);
  EXPECT_EQ(ex.callSites[0].op, "f");
  EXPECT_EQ(ex.callSites[1].op, "g");
  EXPECT_EQ(ex.callSites[2].op, "h");
  EXPECT_EQ(ex.callSites[3].op, "k");
  for (size_t i = 0; i < ex.callSites.size(); ++i) { EXPECT_EQ(ex.callSites[i].index, i); }
  EXPECT_EQ(ex.callSites[2].positional.size(), 2u);
  EXPECT_EQ(ex.operators, (Strings{"f", "g", "h", "k"}));

  ASSERT_EQ(ex.datafieldUses.size(), 3u);
  EXPECT_EQ(ex.datafieldUses[0].enclosingCalls, (std::vector<size_t>{0, 1}));
  EXPECT_EQ(ex.datafieldUses[2].name, "c");
  EXPECT_EQ(ex.datafieldUses[2].enclosingCalls, (std::vector<size_t>{0, 2, 3}));
}

TEST(Extractor, NestedCallsAreIndependent) {
  auto ex = extract::extract("rank(rank(close))");
  ASSERT_EQ(ex.callSites.size(), 2u);
  EXPECT_EQ(ex.operators, (Strings{"rank"}));
  EXPECT_EQ(ex.callSites[0].positional[0]->kind, ast::NodeKind::Call);
  EXPECT_EQ(ex.callSites[1].positional[0]->kind, ast::NodeKind::Name);
}

TEST(Extractor, AugmentedAssignmentReadsThenBinds) {
  auto ex = extract::extract("x += close; x * 2");
  EXPECT_EQ(ex.operators, (Strings{"+=", "*"}));
  EXPECT_EQ(ex.datafields, (Strings{"x", "close"}));
  ASSERT_FALSE(ex.operatorUses.empty());
  EXPECT_EQ(ex.operatorUses[0].form, extract::OperatorForm::Augmented);

  auto local = extract::extract("x = 1; x -= close");
  EXPECT_EQ(local.operators, (Strings{"-="}));
  EXPECT_EQ(local.datafields, (Strings{"close"}));
}

TEST(Extractor, ComparisonBooleanAndUnaryOperators) {
  auto ex = extract::extract("0 < x <= 10 and not y or -z != w is not None");
  EXPECT_EQ(ex.operators, (Strings{"<", "<=", "and", "not", "or", "-", "!=", "is not"}));
  EXPECT_EQ(ex.datafields, (Strings{"x", "y", "z", "w"}));
}

TEST(Extractor, BooleanChainIsOneUse) {
  auto ex = extract::extract("a and b and c or d");
  ASSERT_EQ(ex.operatorUses.size(), 2u);
  EXPECT_EQ(ex.operatorUses[0].op, "and");
  EXPECT_EQ(ex.operatorUses[0].col, 3);
  ASSERT_TRUE(ex.operatorUses[0].operandCount.has_value());
  EXPECT_EQ(*ex.operatorUses[0].operandCount, 3u);
  EXPECT_EQ(ex.operatorUses[1].op, "or");
  EXPECT_EQ(*ex.operatorUses[1].operandCount, 2u);
  EXPECT_EQ(ex.datafields, (Strings{"a", "b", "c", "d"}));

  auto grouped = extract::extract("(a and b) and c");
  ASSERT_EQ(grouped.operatorUses.size(), 2u);
  // the parenthesized chain is walked first
  EXPECT_EQ(grouped.operatorUses[0].col, 4);
  EXPECT_EQ(*grouped.operatorUses[0].operandCount, 2u);
  EXPECT_EQ(grouped.operatorUses[1].col, 11);
  EXPECT_EQ(*grouped.operatorUses[1].operandCount, 2u);
  EXPECT_FALSE(extract::extract("a + b").operatorUses[0].operandCount.has_value());
}

TEST(Extractor, NegativeLiteralIsNotAnOperator) {
  auto ex = extract::extract("f(-1, -2.5)");
  EXPECT_EQ(ex.operators, (Strings{"f"}));
}

TEST(Extractor, OperatorUsesCarryPositionAndForm) {
  auto ex = extract::extract("a + f(b)\nc > d");
  ASSERT_EQ(ex.operatorUses.size(), 3u);
  EXPECT_EQ(ex.operatorUses[0].op, "+");
  EXPECT_EQ(ex.operatorUses[0].form, extract::OperatorForm::Binary);
  EXPECT_EQ(ex.operatorUses[0].col, 3);
  EXPECT_EQ(ex.operatorUses[1].op, "f");
  EXPECT_EQ(ex.operatorUses[1].form, extract::OperatorForm::Call);
  ASSERT_TRUE(ex.operatorUses[1].callIndex.has_value());
  EXPECT_EQ(*ex.operatorUses[1].callIndex, 0u);
  EXPECT_EQ(ex.operatorUses[2].form, extract::OperatorForm::Compare);
  EXPECT_EQ(ex.operatorUses[2].line, 2);
  EXPECT_STREQ(extract::to_string(ex.operatorUses[2].form), "compare");
}

TEST(Extractor, TrailingCommentMarkerIsDropped) {
  auto ex = extract::extract("close + 1 --> bullish signal; open");
  EXPECT_EQ(ex.datafields, (Strings{"close"}));
  EXPECT_EQ(ex.statementCount(), 1u);

  extract::ExtractorOptions opts;
  opts.commentMarker = "";
  EXPECT_THROW((void)extract::extract("close --> x", opts), exceptions::ExprguardException);
}

TEST(Extractor, MarkerInsideStringIsKept) {
  EXPECT_EQ(extract::stripTrailingComment("f(m='a-->b') --> c", "-->"), "f(m='a-->b') ");
  EXPECT_EQ(extract::stripTrailingComment("f(m=\"it\\\"-->\")", "-->"), "f(m=\"it\\\"-->\")");
  EXPECT_EQ(extract::stripTrailingComment("a --> b", ""), "a --> b");
}

TEST(Extractor, QuotesInHashCommentsOpenNoString) {
  EXPECT_EQ(extract::stripTrailingComment("a # don't\nb --> c", "-->"), "a # don't\nb ");
  EXPECT_EQ(extract::stripTrailingComment("a # say \"hi\nb --> c", "-->"), "a # say \"hi\nb ");
  EXPECT_EQ(extract::stripTrailingComment("a # x --> y\nb", "-->"), "a # x ");
  auto ex = extract::extract("a # don't\nb --> c");
  EXPECT_EQ(ex.datafields, (Strings{"a", "b"}));
  EXPECT_EQ(ex.statementCount(), 2u);
}

TEST(Extractor, NewlineClosesUnterminatedQuote) {
  EXPECT_EQ(extract::stripTrailingComment("x = 'a\ny --> z", "-->"), "x = 'a\ny ");
}

TEST(Extractor, LiteralsOnlyAndEmptyInput) {
  auto ex = extract::extract("1; 'x'; True; None");
  EXPECT_TRUE(ex.operators.empty());
  EXPECT_TRUE(ex.datafields.empty());
  auto empty = extract::extract("");
  EXPECT_EQ(empty.statementCount(), 0u);
  EXPECT_TRUE(empty.callSites.empty());
}

TEST(Extractor, MovePreservesArgumentPointers) {
  auto ex = extract::extract("f(close, k=2)");
  const ast::Expr* arg = ex.callSites[0].positional[0];
  extract::Extraction moved = std::move(ex);
  EXPECT_EQ(moved.callSites[0].positional[0], arg);
  EXPECT_EQ(moved.callSites[0].positional[0]->kind, ast::NodeKind::Name);
  EXPECT_EQ(moved.callSites[0].keywords[0].value->kind, ast::NodeKind::IntLiteral);
}
