/***
 * Name: test_parser_expressions
 * Purpose: Precedence, comparison chains, literal folding and call arguments.
 */
#include <gtest/gtest.h>
#include <cstdint>
#include <limits>
#include "ast/Nodes.h"
#include "parser/Parser.h"

using namespace exprguard;

static const ast::Expr& exprOf(const ast::Module& mod, size_t i = 0) {
  return *static_cast<const ast::ExprStmt&>(*mod.body.at(i)).value;
}

TEST(ParserExpressions, MultiplicationBindsTighter) {
  auto mod = parse::Parser::parseExpressionText("a + b * c", "p.expr");
  const auto& add = static_cast<const ast::Binary&>(exprOf(*mod));
  EXPECT_EQ(add.op, ast::BinaryOperator::Add);
  ASSERT_EQ(add.rhs->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(static_cast<const ast::Binary&>(*add.rhs).op, ast::BinaryOperator::Mul);
  // binary nodes sit at their operator token
  EXPECT_EQ(add.col, 3);
}

TEST(ParserExpressions, PowerIsRightAssociative) {
  auto mod = parse::Parser::parseExpressionText("2 ** 3 ** 2", "p.expr");
  const auto& pow = static_cast<const ast::Binary&>(exprOf(*mod));
  EXPECT_EQ(pow.lhs->kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(pow.rhs->kind, ast::NodeKind::BinaryExpr);
}

TEST(ParserExpressions, SingleComparisonIsBinary) {
  auto mod = parse::Parser::parseExpressionText("x is not None", "p.expr");
  const auto& cmp = static_cast<const ast::Binary&>(exprOf(*mod));
  EXPECT_EQ(cmp.op, ast::BinaryOperator::IsNot);
  EXPECT_STREQ(ast::to_symbol(cmp.op), "is not");
}

TEST(ParserExpressions, ComparisonChainRecordsEachOperator) {
  auto mod = parse::Parser::parseExpressionText("0 < x <= 10", "p.expr");
  ASSERT_EQ(exprOf(*mod).kind, ast::NodeKind::Compare);
  const auto& cmp = static_cast<const ast::Compare&>(exprOf(*mod));
  ASSERT_EQ(cmp.ops.size(), 2u);
  EXPECT_EQ(cmp.ops[0], ast::BinaryOperator::Lt);
  EXPECT_EQ(cmp.ops[1], ast::BinaryOperator::Le);
  ASSERT_EQ(cmp.opPositions.size(), 2u);
  EXPECT_EQ(cmp.opPositions[0].second, 3);
  EXPECT_EQ(cmp.opPositions[1].second, 7);
}

TEST(ParserExpressions, BooleanOperatorsAndNot) {
  auto mod = parse::Parser::parseExpressionText("a and not b or c", "p.expr");
  const auto& orNode = static_cast<const ast::Binary&>(exprOf(*mod));
  EXPECT_EQ(orNode.op, ast::BinaryOperator::Or);
  const auto& andNode = static_cast<const ast::Binary&>(*orNode.lhs);
  EXPECT_EQ(andNode.op, ast::BinaryOperator::And);
  ASSERT_EQ(andNode.rhs->kind, ast::NodeKind::UnaryExpr);
  EXPECT_EQ(static_cast<const ast::Unary&>(*andNode.rhs).op, ast::UnaryOperator::Not);
}

TEST(ParserExpressions, BooleanChainCountsOperands) {
  auto mod = parse::Parser::parseExpressionText("a and b and c; (a and b) and c; a or b and c", "p.expr");
  const auto& flat = static_cast<const ast::Binary&>(exprOf(*mod, 0));
  EXPECT_EQ(flat.operands, 3u);
  EXPECT_EQ(static_cast<const ast::Binary&>(*flat.lhs).operands, 2u);

  // parentheses start a new chain
  const auto& grouped = static_cast<const ast::Binary&>(exprOf(*mod, 1));
  EXPECT_EQ(grouped.operands, 2u);
  EXPECT_EQ(static_cast<const ast::Binary&>(*grouped.lhs).operands, 2u);

  const auto& mixed = static_cast<const ast::Binary&>(exprOf(*mod, 2));
  EXPECT_EQ(mixed.op, ast::BinaryOperator::Or);
  EXPECT_EQ(mixed.operands, 2u);
}

TEST(ParserExpressions, SignFoldsIntoNumericLiteral) {
  auto mod = parse::Parser::parseExpressionText("f(-2, -0.5, -x)", "p.expr");
  const auto& call = static_cast<const ast::Call&>(exprOf(*mod));
  ASSERT_EQ(call.args.size(), 3u);
  ASSERT_EQ(call.args[0]->kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(*call.args[0]).value, -2);
  ASSERT_EQ(call.args[1]->kind, ast::NodeKind::FloatLiteral);
  EXPECT_DOUBLE_EQ(static_cast<const ast::FloatLiteral&>(*call.args[1]).value, -0.5);
  EXPECT_EQ(call.args[2]->kind, ast::NodeKind::UnaryExpr);
}

TEST(ParserExpressions, IntegerAndFloatLimits) {
  auto mod = parse::Parser::parseExpressionText("-9223372036854775808; 9223372036854775807; 1e-400; -2 ** 2", "p.expr");
  ASSERT_EQ(exprOf(*mod, 0).kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(exprOf(*mod, 0)).value, std::numeric_limits<int64_t>::min());
  EXPECT_EQ(exprOf(*mod, 0).col, 1);
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(exprOf(*mod, 1)).value, std::numeric_limits<int64_t>::max());
  ASSERT_EQ(exprOf(*mod, 2).kind, ast::NodeKind::FloatLiteral);
  EXPECT_EQ(static_cast<const ast::FloatLiteral&>(exprOf(*mod, 2)).value, 0.0);
  // the sign applies to the whole power
  ASSERT_EQ(exprOf(*mod, 3).kind, ast::NodeKind::UnaryExpr);
}

TEST(ParserExpressions, CallArgumentsSplitIntoPositionalAndKeyword) {
  auto mod = parse::Parser::parseExpressionText("ts_rank(close, 20, rate=0.5, mode='fast')", "p.expr");
  const auto& call = static_cast<const ast::Call&>(exprOf(*mod));
  EXPECT_EQ(static_cast<const ast::Name&>(*call.callee).id, "ts_rank");
  EXPECT_EQ(call.args.size(), 2u);
  ASSERT_EQ(call.keywords.size(), 2u);
  EXPECT_EQ(call.keywords[1].name, "mode");
  ASSERT_EQ(call.keywords[1].value->kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(*call.keywords[1].value).value, "fast");
  EXPECT_EQ(call.line, 1);
  EXPECT_EQ(call.col, 1);
}

TEST(ParserExpressions, LiteralKinds) {
  auto mod = parse::Parser::parseExpressionText("1; 1.5; 'x' \"y\"; True; None; 0x10", "p.expr");
  ASSERT_EQ(mod->body.size(), 6u);
  EXPECT_EQ(exprOf(*mod, 0).kind, ast::NodeKind::IntLiteral);
  EXPECT_EQ(exprOf(*mod, 1).kind, ast::NodeKind::FloatLiteral);
  ASSERT_EQ(exprOf(*mod, 2).kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(exprOf(*mod, 2)).value, "xy");
  EXPECT_EQ(exprOf(*mod, 3).kind, ast::NodeKind::BoolLiteral);
  EXPECT_EQ(exprOf(*mod, 4).kind, ast::NodeKind::NoneLiteral);
  EXPECT_EQ(static_cast<const ast::IntLiteral&>(exprOf(*mod, 5)).value, 16);
}

TEST(ParserExpressions, EscapesDecodedUnlessRaw) {
  auto mod = parse::Parser::parseExpressionText("'a\\tb'; r'a\\tb'", "p.expr");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(exprOf(*mod, 0)).value, "a\tb");
  EXPECT_EQ(static_cast<const ast::StringLiteral&>(exprOf(*mod, 1)).value, "a\\tb");
}

TEST(ParserExpressions, ShapesOutsideTheFormulaSubsetStillParse) {
  auto mod = parse::Parser::parseExpressionText("a.b; a[1]; lambda x: x; a if b else c; [1]; {1: 2}; {1}; f'{x}'; (n := 1)", "p.expr");
  ASSERT_EQ(mod->body.size(), 9u);
  EXPECT_EQ(exprOf(*mod, 0).kind, ast::NodeKind::Attribute);
  EXPECT_EQ(exprOf(*mod, 1).kind, ast::NodeKind::Subscript);
  EXPECT_EQ(exprOf(*mod, 2).kind, ast::NodeKind::LambdaExpr);
  EXPECT_EQ(exprOf(*mod, 3).kind, ast::NodeKind::IfExpr);
  EXPECT_EQ(exprOf(*mod, 4).kind, ast::NodeKind::ListLiteral);
  EXPECT_EQ(exprOf(*mod, 5).kind, ast::NodeKind::DictLiteral);
  EXPECT_EQ(exprOf(*mod, 6).kind, ast::NodeKind::SetLiteral);
  EXPECT_EQ(exprOf(*mod, 7).kind, ast::NodeKind::FStringLiteral);
  EXPECT_EQ(exprOf(*mod, 8).kind, ast::NodeKind::NamedExpr);
}
