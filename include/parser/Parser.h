/***
 * Name: exprguard::parse::Parser
 * Purpose: Build an AST Module from the expression token stream.
 * Inputs:
 *   - Token stream from Lexer (pull-based)
 * Outputs:
 *   - Module AST holding the top-level statements in source order.
 * Theory of Operation:
 *   A recursive-descent parser reading from ITokenStream. It recognizes:
 *     module    := { stmt (';' | NEWLINE) }
 *     stmt      := target '=' { target '=' } exprlist
 *                | target augop expr
 *                | 'if' / 'while' / 'for' header ':' suite
 *                | 'return' [exprlist] | 'pass' | exprlist
 *     suite     := simple statements up to the end of one logical line
 *   Indentation is not significant. Syntax errors are collected with
 *   statement-level recovery and thrown once as a SyntaxError carrying the
 *   farthest failure point and up to three notes. Statement keywords with no
 *   place in a formula (def, class, import, ...) throw UnsupportedConstruct.
 */
#pragma once

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "exprguard/exceptions/syntax_error.h"
#include "exprguard/exceptions/unsupported_construct.h"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace exprguard::parse {

class Parser {
 public:
  explicit Parser(lex::ITokenStream& stream) : ts_(stream) {}
  std::unique_ptr<ast::Module> parseModule();

  // Convenience: tokenize and parse one expression text
  static std::unique_ptr<ast::Module> parseExpressionText(const std::string& text,
                                                          const std::string& name);

 private:
  lex::ITokenStream& ts_;
  std::vector<lex::Token> tokens_{};
  size_t pos_{0};
  bool initialized_{false};

  struct ErrorEntry {
    std::string text; // formatted with context
    int line{0};
    int col{0};
  };
  std::vector<ErrorEntry> errors_{};
  size_t farthestPos_{0};
  std::string farthestExpected_{};

  void initBuffer();
  const lex::Token& peek() const;
  const lex::Token& peekNext() const;
  lex::Token get();
  bool match(lex::TokenKind tokenKind);
  void expect(lex::TokenKind tokenKind, const char* msg);

  // Diagnostics and recovery
  void recordExpectation(const char* msg);
  void addError(const std::string& msg, int line, int col);
  void synchronize();
  std::string formatContext(const lex::Token& tok, const std::string& headMsg) const;
  exceptions::SyntaxError syntaxError(const lex::Token& tok, const std::string& msg) const;
  exceptions::UnsupportedConstruct unsupported(const lex::Token& tok, const std::string& construct) const;

  // Statements
  std::unique_ptr<ast::Stmt> parseStatement();
  std::unique_ptr<ast::Stmt> parseSimpleStatement();
  std::unique_ptr<ast::Stmt> parseIfStmt();
  std::unique_ptr<ast::Stmt> parseWhileStmt();
  std::unique_ptr<ast::Stmt> parseForStmt();
  void parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out);
  bool atStatementEnd() const;
  void skipNewlinesBefore(lex::TokenKind kind);

  // Expressions
  std::unique_ptr<ast::Expr> parseExprList();
  std::unique_ptr<ast::Expr> parseExpr();
  std::unique_ptr<ast::Expr> parseLambda();
  std::unique_ptr<ast::Expr> parseLogicalOr();
  std::unique_ptr<ast::Expr> parseLogicalAnd();
  std::unique_ptr<ast::Expr> parseLogicalNot();
  std::unique_ptr<ast::Expr> parseComparison();
  std::unique_ptr<ast::Expr> parseBitwiseOr();
  std::unique_ptr<ast::Expr> parseBitwiseXor();
  std::unique_ptr<ast::Expr> parseBitwiseAnd();
  std::unique_ptr<ast::Expr> parseShift();
  std::unique_ptr<ast::Expr> parseAdditive();
  std::unique_ptr<ast::Expr> parseMultiplicative();
  std::unique_ptr<ast::Expr> parseUnary();
  std::unique_ptr<ast::Expr> parsePower();
  std::unique_ptr<ast::Expr> parsePrimary();
  std::unique_ptr<ast::Expr> parsePostfix(std::unique_ptr<ast::Expr> base);

  // Refactoring helpers (kept private)
  std::unique_ptr<ast::Expr> parseStringAtom(const lex::Token& first);
  // negated: the literal follows a unary minus (admits -2**63)
  std::unique_ptr<ast::Expr> parseIntLiteral(const lex::Token& tok, bool negated = false) const;
  std::unique_ptr<ast::Expr> parseFloatLiteral(const lex::Token& tok) const;
  std::unique_ptr<ast::Expr> parseListLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseTupleOrParen(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseDictOrSetLiteral(const lex::Token& openTok);
  std::unique_ptr<ast::Expr> parseSubscriptSlice();
  struct ArgList {
    std::vector<std::unique_ptr<ast::Expr>> positional;
    std::vector<ast::KeywordArg> keywords;
    std::vector<std::unique_ptr<ast::Expr>> starArgs;
    std::vector<std::unique_ptr<ast::Expr>> kwStarArgs;
  };
  ArgList parseArgList();
  void rejectComprehension();
  static ast::BinaryOperator mulOpFor(lex::TokenKind kind);
  static bool augOpFor(lex::TokenKind kind, ast::BinaryOperator& out);
  static std::string unquoteString(const std::string& text, bool& isRaw);
  static std::string decodeEscapes(const std::string& body);

  // Validate whether an expression is a legal assignment target
  static bool isValidAssignmentTarget(const ast::Expr* e);

  // Look ahead on the current logical line for an un-nested '='
  bool hasPendingEqualOnLine() const;
  bool hasPendingAugAssignOnLine(lex::TokenKind& which) const;
};

} // namespace exprguard::parse
