/***
 * Name: test_parser_statements
 * Purpose: Statement shapes: separators, assignment chains, augmented assignment.
 */
#include <gtest/gtest.h>
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace exprguard;

static std::unique_ptr<ast::Module> parseSrc(const char* src) {
  lex::Lexer L; L.pushString(src, "stmt.expr");
  parse::Parser P(L);
  return P.parseModule();
}

TEST(ParserStatements, SemicolonAndNewlineSeparate) {
  auto mod = parseSrc("a = 1; b = a\nb + 1;");
  ASSERT_EQ(mod->body.size(), 3u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::ExprStmt);
}

TEST(ParserStatements, AssignmentChainKeepsTargetsInOrder) {
  auto mod = parseSrc("a = b = close - open");
  ASSERT_EQ(mod->body.size(), 1u);
  const auto& asg = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  ASSERT_EQ(asg.targets.size(), 2u);
  EXPECT_EQ(static_cast<const ast::Name&>(*asg.targets[0]).id, "a");
  EXPECT_EQ(static_cast<const ast::Name&>(*asg.targets[1]).id, "b");
  ASSERT_EQ(asg.value->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(static_cast<const ast::Binary&>(*asg.value).op, ast::BinaryOperator::Sub);
}

TEST(ParserStatements, KeywordArgumentIsNotAnAssignment) {
  auto mod = parseSrc("ts_mean(close, d=5)");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::ExprStmt);
  const auto& call = static_cast<const ast::Call&>(*static_cast<const ast::ExprStmt&>(*mod->body[0]).value);
  ASSERT_EQ(call.keywords.size(), 1u);
  EXPECT_EQ(call.keywords[0].name, "d");
  EXPECT_EQ(call.keywords[0].col, 16);
}

TEST(ParserStatements, AugmentedAssignment) {
  auto mod = parseSrc("x //= 2");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::AugAssignStmt);
  const auto& aug = static_cast<const ast::AugAssignStmt&>(*mod->body[0]);
  EXPECT_EQ(aug.op, ast::BinaryOperator::FloorDiv);
  EXPECT_EQ(aug.target->kind, ast::NodeKind::Name);
}

TEST(ParserStatements, TupleTargetParsesForLaterRejection) {
  auto mod = parseSrc("a, b = 1, 2");
  const auto& asg = static_cast<const ast::AssignStmt&>(*mod->body[0]);
  EXPECT_EQ(asg.targets[0]->kind, ast::NodeKind::TupleLiteral);
  EXPECT_EQ(asg.value->kind, ast::NodeKind::TupleLiteral);
}

TEST(ParserStatements, IfWithElseOnFollowingLine) {
  auto mod = parseSrc("if x > 1: y = 2\nelse: y = 3");
  ASSERT_EQ(mod->body.size(), 1u);
  const auto& ifs = static_cast<const ast::IfStmt&>(*mod->body[0]);
  EXPECT_EQ(ifs.thenBody.size(), 1u);
  EXPECT_EQ(ifs.elseBody.size(), 1u);
}

TEST(ParserStatements, BlankLinesAndEmptyInput) {
  EXPECT_TRUE(parseSrc("")->body.empty());
  EXPECT_TRUE(parseSrc("\n;\n  \n")->body.empty());
}

TEST(ParserStatements, ParseExpressionTextStampsSourceName) {
  auto mod = parse::Parser::parseExpressionText("a + b", "formula-7");
  ASSERT_EQ(mod->body.size(), 1u);
  EXPECT_EQ(mod->body[0]->file, "formula-7");
}
