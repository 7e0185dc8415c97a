/***
 * Name: test_parser_errors
 * Purpose: Syntax errors with recovery notes; unsupported statement keywords.
 */
#include <gtest/gtest.h>
#include <string>
#include "exprguard/exceptions/syntax_error.h"
#include "exprguard/exceptions/unsupported_construct.h"
#include "parser/Parser.h"

using namespace exprguard;

static std::string syntaxMessage(const char* src) {
  try {
    (void)parse::Parser::parseExpressionText(src, "err.expr");
  } catch (const exceptions::SyntaxError& e) {
    return e.what();
  }
  return "<no error>";
}

static std::string unsupportedConstruct(const char* src) {
  try {
    (void)parse::Parser::parseExpressionText(src, "err.expr");
  } catch (const exceptions::UnsupportedConstruct& e) {
    return e.construct();
  }
  return "<no error>";
}

TEST(ParserErrors, MissingOperandAtEnd) {
  const auto msg = syntaxMessage("a = (1 +");
  EXPECT_NE(msg.find("expected expression, got end of input"), std::string::npos) << msg;
}

TEST(ParserErrors, RecoversAndReportsFarthestWithNotes) {
  try {
    (void)parse::Parser::parseExpressionText("a = ; b = 2; c = )", "err.expr");
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    const std::string msg = e.what();
    EXPECT_EQ(e.line(), 1);
    EXPECT_EQ(e.col(), 18);
    EXPECT_EQ(msg.rfind("err.expr:1:18: expected expression, got ')'", 0), 0u) << msg;
    EXPECT_NE(msg.find("\nnote: err.expr:1:5: expected expression, got ';'"), std::string::npos) << msg;
  }
}

TEST(ParserErrors, TrailingTokensNeedSeparator) {
  const auto msg = syntaxMessage("a = 1 2");
  EXPECT_NE(msg.find("expected ';' or newline"), std::string::npos) << msg;
}

TEST(ParserErrors, RepeatedKeywordArgument) {
  const auto msg = syntaxMessage("f(a=1, a=2)");
  EXPECT_NE(msg.find("keyword argument repeated: 'a'"), std::string::npos) << msg;
}

TEST(ParserErrors, PositionalAfterKeyword) {
  const auto msg = syntaxMessage("f(a=1, 2)");
  EXPECT_NE(msg.find("positional argument follows keyword argument"), std::string::npos) << msg;
}

TEST(ParserErrors, CannotAssignToCall) {
  const auto msg = syntaxMessage("f(x) = 1");
  EXPECT_NE(msg.find("cannot assign to Call"), std::string::npos) << msg;
}

TEST(ParserErrors, LeadingZerosRejected) {
  const auto msg = syntaxMessage("x + 007");
  EXPECT_NE(msg.find("leading zeros"), std::string::npos) << msg;
}

TEST(ParserErrors, NumericLiteralsOutOfRange) {
  EXPECT_NE(syntaxMessage("9223372036854775808").find("integer literal out of range"), std::string::npos);
  EXPECT_NE(syntaxMessage("-9223372036854775809").find("integer literal out of range"), std::string::npos);
  EXPECT_NE(syntaxMessage("--9223372036854775808").find("integer literal out of range"), std::string::npos);
  EXPECT_NE(syntaxMessage("x = 1e400").find("float literal out of range"), std::string::npos);
}

TEST(ParserErrors, StatementKeywordsAreUnsupported) {
  EXPECT_EQ(unsupportedConstruct("def f(): pass"), "'def' statement");
  EXPECT_EQ(unsupportedConstruct("import os"), "'import' statement");
  EXPECT_EQ(unsupportedConstruct("x = yield"), "'yield' expression");
}

TEST(ParserErrors, BytesAndComprehensionsAreUnsupported) {
  EXPECT_EQ(unsupportedConstruct("f(b'x')"), "bytes literal");
  EXPECT_EQ(unsupportedConstruct("[x for x in y]"), "comprehension");
  EXPECT_EQ(unsupportedConstruct("{**d}"), "dict unpacking");
}
