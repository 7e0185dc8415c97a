/***
 * Name: test_extractor_unsupported
 * Purpose: Every node outside the formula subset is rejected, never skipped.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include "exprguard/exceptions/syntax_error.h"
#include "exprguard/exceptions/unsupported_construct.h"
#include "exprguard/exceptions/validation_input_error.h"
#include "extract/Extractor.h"
#include "parser/Parser.h"

using namespace exprguard;

static std::string rejected(const char* src) {
  try {
    (void)extract::extract(src);
  } catch (const exceptions::UnsupportedConstruct& e) {
    return e.construct();
  }
  return "<accepted>";
}

TEST(ExtractorUnsupported, ControlFlowStatements) {
  EXPECT_EQ(rejected("if x: y = 1"), "'if' statement");
  EXPECT_EQ(rejected("while x: y = 1"), "'while' statement");
  EXPECT_EQ(rejected("for i in x: y = i"), "'for' statement");
  EXPECT_EQ(rejected("return x"), "'return' statement");
  EXPECT_EQ(rejected("pass"), "'pass' statement");
}

TEST(ExtractorUnsupported, ExpressionShapes) {
  EXPECT_EQ(rejected("close.shift"), "attribute access");
  EXPECT_EQ(rejected("close[1]"), "subscript");
  EXPECT_EQ(rejected("f(lambda x: x)"), "lambda");
  EXPECT_EQ(rejected("a if b else c"), "conditional expression");
  EXPECT_EQ(rejected("(n := close)"), "assignment expression");
  EXPECT_EQ(rejected("f([1, 2])"), "list display");
  EXPECT_EQ(rejected("x = 1, 2"), "tuple");
  EXPECT_EQ(rejected("f({'a': 1})"), "dict display");
  EXPECT_EQ(rejected("f({1})"), "set display");
  EXPECT_EQ(rejected("f(f'{close}')"), "f-string");
}

TEST(ExtractorUnsupported, CallShapes) {
  EXPECT_EQ(rejected("close.rolling(5)"), "non-name call target");
  EXPECT_EQ(rejected("f(*args)"), "star argument");
  EXPECT_EQ(rejected("f(**opts)"), "keyword unpacking");
}

TEST(ExtractorUnsupported, AssignmentTargets) {
  EXPECT_EQ(rejected("a, b = 1"), "assignment to TupleLiteral");
  EXPECT_EQ(rejected("x[0] = 1"), "assignment to Subscript");
  EXPECT_EQ(rejected("x.y += 1"), "assignment to Attribute");
}

TEST(ExtractorUnsupported, RejectionCarriesPositionAndCaret) {
  try {
    (void)extract::extract("x = 1\ny = a.b");
    FAIL() << "expected UnsupportedConstruct";
  } catch (const exceptions::UnsupportedConstruct& e) {
    EXPECT_EQ(e.line(), 2);
    EXPECT_EQ(e.col(), 6);
    const std::string msg = e.what();
    EXPECT_EQ(msg, "<expr>:2:6: attribute access is not supported in expressions\ny = a.b\n     ^");
  }
}

TEST(ExtractorUnsupported, SyntaxErrorsPropagate) {
  EXPECT_THROW((void)extract::extract("close +"), exceptions::SyntaxError);
  extract::ExtractorOptions opts;
  opts.sourceName = "alpha_42";
  try {
    (void)extract::extract("f(", opts);
    FAIL() << "expected SyntaxError";
  } catch (const exceptions::SyntaxError& e) {
    EXPECT_EQ(std::string(e.what()).rfind("alpha_42:", 0), 0u) << e.what();
  }
}

TEST(ExtractorUnsupported, NullTreeIsAnInputError) {
  extract::Extractor ex;
  EXPECT_THROW((void)ex.extract(std::unique_ptr<ast::Module>{}), exceptions::ValidationInputError);
}

TEST(ExtractorUnsupported, PreParsedTreeIsWalked) {
  extract::Extractor ex;
  auto result = ex.extract(parse::Parser::parseExpressionText("a * b", "pre"));
  EXPECT_EQ(result.operators.size(), 1u);
  EXPECT_EQ(result.datafields.size(), 2u);
}
