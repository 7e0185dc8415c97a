/***
 * Name: test_ast_printer
 * Purpose: Indented AST dump used by the gate's logAst option.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "observability/AstPrinter.h"
#include "parser/Parser.h"

using namespace exprguard;

static std::unique_ptr<ast::Module> parseText(const char* src) {
  return parse::Parser::parseExpressionText(src, "printer_test");
}

TEST(ObservabilityAstPrinter, PrintsTreeWithIndentation) {
  auto mod = parseText("x = ts_mean(close, 5, k=2)");
  obs::AstPrinter p;
  EXPECT_EQ(p.print(*mod),
            "Module\n"
            "  AssignStmt\n"
            "    Name x\n"
            "    Call k=\n"
            "      Name ts_mean\n"
            "      Name close\n"
            "      IntLiteral 5\n"
            "      IntLiteral 2\n");
}

TEST(ObservabilityAstPrinter, DescribesOperators) {
  auto mod = parseText("-close + open; a < b <= c; y -= 1; not flag; mode is not None");
  obs::AstPrinter p;
  const auto out = p.print(*mod);
  EXPECT_NE(out.find("BinaryExpr +\n"), std::string::npos);
  EXPECT_NE(out.find("UnaryExpr -\n"), std::string::npos);
  EXPECT_NE(out.find("Compare < <=\n"), std::string::npos);
  EXPECT_NE(out.find("AugAssignStmt -=\n"), std::string::npos);
  EXPECT_NE(out.find("UnaryExpr not\n"), std::string::npos);
  EXPECT_NE(out.find("BinaryExpr is not\n"), std::string::npos);
  EXPECT_NE(out.find("NoneLiteral\n"), std::string::npos);
}

TEST(ObservabilityAstPrinter, PrinterIsReusable) {
  auto first = parseText("a");
  auto second = parseText("'s'");
  obs::AstPrinter p;
  p.print(*first);
  EXPECT_EQ(p.print(*second), "Module\n  ExprStmt\n    StringLiteral \"s\"\n");
}
