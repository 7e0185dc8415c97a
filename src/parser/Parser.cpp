/***
 * Name: exprguard::parse::Parser (impl)
 * Purpose: Recursive-descent parser for formula expressions.
 */
#include "parser/Parser.h"
#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace exprguard::parse {

using TK = lex::TokenKind;

namespace {
template <typename N>
std::unique_ptr<N> stamp(std::unique_ptr<N> node, const lex::Token& tok) {
  node->line = tok.line; node->col = tok.col; node->file = tok.file;
  return node;
}

std::string friendlyText(const lex::Token& tok) {
  switch (tok.kind) {
    case TK::End: return "end of input";
    case TK::Newline: return "newline";
    default: return "'" + tok.text + "'";
  }
}
} // namespace

void Parser::initBuffer() {
  if (initialized_) return;
  // Try to access the full token stream when backed by Lexer; otherwise, drain
  if (auto* lx = dynamic_cast<lex::Lexer*>(&ts_)) {
    tokens_ = lx->tokens();
  } else {
    tokens_.clear();
    for (;;) {
      auto t = ts_.next();
      tokens_.push_back(t);
      if (t.kind == TK::End) break;
    }
  }
  pos_ = 0;
  initialized_ = true;
}

const lex::Token& Parser::peek() const {
  // Safe in presence of End sentry
  return tokens_[pos_ < tokens_.size() ? pos_ : (tokens_.size() - 1)];
}
const lex::Token& Parser::peekNext() const {
  const size_t idx = pos_ + 1;
  return tokens_[idx < tokens_.size() ? idx : (tokens_.size() - 1)];
}
lex::Token Parser::get() {
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

bool Parser::match(TK tokenKind) {
  if (peek().kind == tokenKind) { (void)get(); return true; }
  return false;
}

void Parser::recordExpectation(const char* msg) {
  if (pos_ >= farthestPos_) {
    farthestPos_ = pos_;
    farthestExpected_ = msg ? msg : "<token>";
  }
}

void Parser::addError(const std::string& msg, const int line, const int col) {
  errors_.push_back(ErrorEntry{msg, line, col});
}

void Parser::synchronize() {
  // Delimiter-aware synchronization: balance (), [], {} while skipping ahead.
  int depth = 0;
  for (;;) {
    const auto& t = peek();
    if (t.kind == TK::End) break;
    if (t.kind == TK::LParen || t.kind == TK::LBracket || t.kind == TK::LBrace) { ++depth; (void)get(); continue; }
    if (t.kind == TK::RParen || t.kind == TK::RBracket || t.kind == TK::RBrace) { if (depth > 0) --depth; (void)get(); continue; }
    // When not nested inside delimiters, a statement separator is a good boundary
    if (depth == 0 && (t.kind == TK::Newline || t.kind == TK::Semicolon)) { break; }
    (void)get();
  }
  if (peek().kind == TK::Newline || peek().kind == TK::Semicolon) { (void)get(); }
}

std::string Parser::formatContext(const lex::Token& tok, const std::string& headMsg) const {
  const std::string* srcLine = nullptr;
  if (const auto* lx = dynamic_cast<const lex::Lexer*>(&ts_)) {
    const auto* lines = lx->sourceLines(tok.file);
    if (lines != nullptr && tok.line > 0 && static_cast<size_t>(tok.line) - 1 < lines->size()) {
      srcLine = &(*lines)[static_cast<size_t>(tok.line) - 1];
    }
  }
  const size_t width = (tok.kind == TK::Newline || tok.kind == TK::End) ? 1 : tok.text.size();
  return lex::formatContext(tok.file, tok.line, tok.col, width, headMsg, srcLine);
}

exceptions::SyntaxError Parser::syntaxError(const lex::Token& tok, const std::string& msg) const {
  return exceptions::SyntaxError(formatContext(tok, msg), tok.line, tok.col);
}

exceptions::UnsupportedConstruct Parser::unsupported(const lex::Token& tok, const std::string& construct) const {
  return exceptions::UnsupportedConstruct(construct, formatContext(tok, construct + " is not supported in expressions"),
                                          tok.line, tok.col);
}

void Parser::expect(TK tokenKind, const char* msg) {
  if (!match(tokenKind)) {
    recordExpectation(msg);
    const auto& got = peek();
    throw syntaxError(got, std::string("expected ") + msg + ", got " + friendlyText(got));
  }
}

std::unique_ptr<ast::Module> Parser::parseModule() {
  initBuffer();
  auto mod = std::make_unique<ast::Module>();
  // Stamp module with source filename from the first token, if any
  if (!tokens_.empty()) {
    mod->file = tokens_[0].file;
    mod->line = 1; mod->col = 1;
  }
  while (peek().kind != TK::End) {
    if (peek().kind == TK::Newline || peek().kind == TK::Semicolon) { get(); continue; }
    try {
      mod->body.emplace_back(parseStatement());
      if (!atStatementEnd()) {
        recordExpectation("';' or newline");
        const auto& got = peek();
        throw syntaxError(got, "expected ';' or newline, got " + friendlyText(got));
      }
    } catch (const exceptions::SyntaxError& ex) {
      addError(ex.what(), ex.line(), ex.col());
      synchronize();
    }
  }
  if (!errors_.empty()) {
    // Build a primary message at the farthest point, with context
    std::ostringstream oss;
    int line = errors_.front().line;
    int col = errors_.front().col;
    std::string primary = errors_.front().text;
    if (!farthestExpected_.empty() && !tokens_.empty()) {
      const size_t idx = (farthestPos_ < tokens_.size()) ? farthestPos_ : (tokens_.size() - 1);
      const auto& tok = tokens_[idx];
      primary = formatContext(tok, "expected " + farthestExpected_ + ", got " + friendlyText(tok));
      line = tok.line; col = tok.col;
    }
    oss << primary;
    // Append notes for additional recovered errors (limit to 3)
    size_t notes = 0;
    for (const auto& e : errors_) {
      if (notes >= 3) break;
      if (e.text == primary) continue;
      oss << "\nnote: " << e.text;
      ++notes;
    }
    throw exceptions::SyntaxError(oss.str(), line, col);
  }
  return mod;
}

std::unique_ptr<ast::Module> Parser::parseExpressionText(const std::string& text, const std::string& name) {
  lex::Lexer L; L.pushString(text, name);
  Parser P(L);
  return P.parseModule();
}

bool Parser::atStatementEnd() const {
  const auto k = peek().kind;
  return k == TK::Newline || k == TK::Semicolon || k == TK::End;
}

std::unique_ptr<ast::Stmt> Parser::parseStatement() {
  const auto& tok = peek();
  if (tok.kind == TK::Reserved) { throw unsupported(tok, "'" + tok.text + "' statement"); }
  if (tok.kind == TK::If) { return parseIfStmt(); }
  if (tok.kind == TK::While) { return parseWhileStmt(); }
  if (tok.kind == TK::For) { return parseForStmt(); }
  return parseSimpleStatement();
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Stmt> Parser::parseSimpleStatement() {
  if (peek().kind == TK::Reserved) { throw unsupported(peek(), "'" + peek().text + "' statement"); }
  if (peek().kind == TK::Pass) { return stamp(std::make_unique<ast::PassStmt>(), get()); }
  if (peek().kind == TK::Return) {
    const auto retTok = get();
    std::unique_ptr<ast::Expr> value;
    if (!atStatementEnd()) { value = parseExprList(); }
    return stamp(std::make_unique<ast::ReturnStmt>(std::move(value)), retTok);
  }
  // Augmented assignment (single target only)
  {
    lex::TokenKind which{};
    if (hasPendingAugAssignOnLine(which)) {
      const auto startTok = peek();
      auto target = parseBitwiseOr();
      const auto opTok = get(); // the op-equal token
      if (opTok.kind != which) { throw syntaxError(opTok, "expected augmented assignment operator"); }
      if (!isValidAssignmentTarget(target.get()) || target->kind == ast::NodeKind::TupleLiteral ||
          target->kind == ast::NodeKind::ListLiteral) {
        throw syntaxError(startTok, "invalid augmented assignment target");
      }
      ast::BinaryOperator op = ast::BinaryOperator::Add;
      (void)augOpFor(which, op);
      auto rhs = parseExpr();
      auto node = std::make_unique<ast::AugAssignStmt>(std::move(target), op, std::move(rhs));
      // Prefer the target's source location
      node->line = node->target->line; node->col = node->target->col; node->file = node->target->file;
      return node;
    }
  }
  // Assignment chains: a = b = value (targets may be tuples, attributes, subscripts)
  if (hasPendingEqualOnLine()) {
    std::vector<std::unique_ptr<ast::Expr>> targets;
    do {
      const auto startTok = peek();
      auto t = parseExprList();
      if (!isValidAssignmentTarget(t.get())) {
        throw syntaxError(startTok, std::string("cannot assign to ") + ast::to_string(t->kind));
      }
      targets.emplace_back(std::move(t));
      expect(TK::Equal, "'='");
    } while (hasPendingEqualOnLine());
    auto rhs = parseExprList();
    auto asg = std::make_unique<ast::AssignStmt>(std::move(rhs));
    asg->targets = std::move(targets);
    const auto* t0 = asg->targets.front().get();
    asg->line = t0->line; asg->col = t0->col; asg->file = t0->file;
    return asg;
  }
  // Fallback: expression statement
  auto expr = parseExprList();
  auto stmt = std::make_unique<ast::ExprStmt>(std::move(expr));
  stmt->line = stmt->value->line; stmt->col = stmt->value->col; stmt->file = stmt->value->file;
  return stmt;
}

void Parser::skipNewlinesBefore(TK kind) {
  size_t i = pos_;
  while (i < tokens_.size() && tokens_[i].kind == TK::Newline) { ++i; }
  if (i < tokens_.size() && tokens_[i].kind == kind) { pos_ = i; }
}

void Parser::parseSuiteInto(std::vector<std::unique_ptr<ast::Stmt>>& out) {
  // Body may follow on the same line or on the next non-blank line
  while (peek().kind == TK::Newline) { get(); }
  if (peek().kind == TK::End) {
    recordExpectation("statement");
    throw syntaxError(peek(), "expected statement, got end of input");
  }
  out.emplace_back(parseStatement());
  while (peek().kind == TK::Semicolon) {
    get();
    if (atStatementEnd()) break;
    out.emplace_back(parseSimpleStatement());
  }
}

std::unique_ptr<ast::Stmt> Parser::parseIfStmt() {
  const auto ifTok = get();
  auto cond = parseExpr();
  expect(TK::Colon, "':'");
  auto ifs = stamp(std::make_unique<ast::IfStmt>(std::move(cond)), ifTok);
  parseSuiteInto(ifs->thenBody);
  // elif chain as nested IfStmt in else
  ast::IfStmt* cur = ifs.get();
  skipNewlinesBefore(TK::Elif);
  while (peek().kind == TK::Elif) {
    const auto elifTok = get();
    auto econd = parseExpr();
    expect(TK::Colon, "':'");
    auto elifNode = stamp(std::make_unique<ast::IfStmt>(std::move(econd)), elifTok);
    parseSuiteInto(elifNode->thenBody);
    cur->elseBody.emplace_back(std::move(elifNode));
    cur = static_cast<ast::IfStmt*>(cur->elseBody.back().get());
    skipNewlinesBefore(TK::Elif);
  }
  skipNewlinesBefore(TK::Else);
  if (peek().kind == TK::Else) {
    get();
    expect(TK::Colon, "':'");
    parseSuiteInto(cur->elseBody);
  }
  return ifs;
}

std::unique_ptr<ast::Stmt> Parser::parseWhileStmt() {
  const auto tok = get();
  auto cond = parseExpr();
  expect(TK::Colon, "':'");
  auto ws = stamp(std::make_unique<ast::WhileStmt>(std::move(cond)), tok);
  parseSuiteInto(ws->thenBody);
  skipNewlinesBefore(TK::Else);
  if (peek().kind == TK::Else) { get(); expect(TK::Colon, "':'"); parseSuiteInto(ws->elseBody); }
  return ws;
}

std::unique_ptr<ast::Stmt> Parser::parseForStmt() {
  const auto tok = get();
  std::vector<std::unique_ptr<ast::Expr>> lhsTargets;
  lhsTargets.emplace_back(parseBitwiseOr());
  while (peek().kind == TK::Comma) {
    get();
    if (peek().kind == TK::In) break;
    lhsTargets.emplace_back(parseBitwiseOr());
  }
  std::unique_ptr<ast::Expr> target;
  if (lhsTargets.size() == 1) {
    target = std::move(lhsTargets[0]);
  } else {
    auto tup = stamp(std::make_unique<ast::TupleLiteral>(), tok);
    for (auto& e : lhsTargets) tup->elements.emplace_back(std::move(e));
    target = std::move(tup);
  }
  if (!isValidAssignmentTarget(target.get())) { throw syntaxError(tok, "invalid for-target"); }
  expect(TK::In, "'in'");
  auto iter = parseExprList();
  expect(TK::Colon, "':'");
  auto fs = stamp(std::make_unique<ast::ForStmt>(std::move(target), std::move(iter)), tok);
  parseSuiteInto(fs->thenBody);
  skipNewlinesBefore(TK::Else);
  if (peek().kind == TK::Else) { get(); expect(TK::Colon, "':'"); parseSuiteInto(fs->elseBody); }
  return fs;
}

// exprlist: expr {',' expr} [','] -> a bare tuple when a comma is present
std::unique_ptr<ast::Expr> Parser::parseExprList() {
  auto first = parseExpr();
  if (peek().kind != TK::Comma) { return first; }
  auto tup = std::make_unique<ast::TupleLiteral>();
  tup->line = first->line; tup->col = first->col; tup->file = first->file;
  tup->elements.emplace_back(std::move(first));
  while (peek().kind == TK::Comma) {
    get();
    if (atStatementEnd() || peek().kind == TK::Equal) break;
    tup->elements.emplace_back(parseExpr());
  }
  return tup;
}

std::unique_ptr<ast::Expr> Parser::parseExpr() {
  // Named expression: NAME := expr
  if (peek().kind == TK::Ident && peekNext().kind == TK::ColonEqual) {
    const auto nameTok = get(); // NAME
    (void)get(); // ':='
    auto rhs = parseExpr();
    return stamp(std::make_unique<ast::NamedExpr>(nameTok.text, std::move(rhs)), nameTok);
  }
  if (peek().kind == TK::Lambda) { return parseLambda(); }
  // Conditional expression: <expr> if <expr> else <expr>
  auto condBase = parseLogicalOr();
  if (peek().kind == TK::If) {
    const auto ifTok = get();
    auto test = parseLogicalOr();
    expect(TK::Else, "'else'");
    auto orelse = parseExpr();
    return stamp(std::make_unique<ast::IfExpr>(std::move(condBase), std::move(test), std::move(orelse)), ifTok);
  }
  return condBase;
}

std::unique_ptr<ast::Expr> Parser::parseLambda() {
  const auto tok = get(); // 'lambda'
  std::vector<std::string> params;
  if (peek().kind != TK::Colon) {
    for (;;) {
      const auto pn = get();
      if (pn.kind != TK::Ident) { throw syntaxError(pn, "expected parameter name in lambda"); }
      params.push_back(pn.text);
      if (peek().kind != TK::Comma) break;
      get();
    }
  }
  expect(TK::Colon, "':'");
  auto lam = stamp(std::make_unique<ast::LambdaExpr>(), tok);
  lam->params = std::move(params);
  lam->body = parseExpr();
  return lam;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalOr() {
  auto lhs = parseLogicalAnd();
  size_t operands = 1;
  while (peek().kind == TK::Or) {
    auto tok = get();
    auto rhs = parseLogicalAnd();
    lhs = stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::Or, std::move(lhs), std::move(rhs)), tok);
    static_cast<ast::Binary&>(*lhs).operands = ++operands;
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalAnd() {
  auto lhs = parseLogicalNot();
  size_t operands = 1;
  while (peek().kind == TK::And) {
    auto tok = get();
    auto rhs = parseLogicalNot();
    lhs = stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::And, std::move(lhs), std::move(rhs)), tok);
    static_cast<ast::Binary&>(*lhs).operands = ++operands;
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseLogicalNot() {
  if (peek().kind == TK::Not) {
    auto notTok = get();
    auto operand = parseLogicalNot();
    return stamp(std::make_unique<ast::Unary>(ast::UnaryOperator::Not, std::move(operand)), notTok);
  }
  return parseComparison();
}

std::unique_ptr<ast::Expr> Parser::parseComparison() {
  auto left = parseBitwiseOr();
  // collect chain
  std::vector<ast::BinaryOperator> ops;
  std::vector<lex::Token> opToks;
  std::vector<std::unique_ptr<ast::Expr>> comps;
  for (;;) {
    const auto k = peek().kind;
    if (!(k == TK::EqEq || k == TK::NotEq || k == TK::Lt || k == TK::Le || k == TK::Gt || k == TK::Ge || k == TK::Is || k == TK::In || (k == TK::Not && peekNext().kind == TK::In))) {
      break;
    }
    auto opTok = get();
    ast::BinaryOperator binOp = ast::BinaryOperator::Eq;
    if (opTok.kind == TK::Not) { get(); binOp = ast::BinaryOperator::NotIn; }
    else {
      switch (opTok.kind) {
        case TK::EqEq: binOp = ast::BinaryOperator::Eq; break;
        case TK::NotEq: binOp = ast::BinaryOperator::Ne; break;
        case TK::Lt: binOp = ast::BinaryOperator::Lt; break;
        case TK::Le: binOp = ast::BinaryOperator::Le; break;
        case TK::Gt: binOp = ast::BinaryOperator::Gt; break;
        case TK::Ge: binOp = ast::BinaryOperator::Ge; break;
        case TK::Is: binOp = (peek().kind == TK::Not ? (get(), ast::BinaryOperator::IsNot) : ast::BinaryOperator::Is); break;
        case TK::In: binOp = ast::BinaryOperator::In; break;
        default: break;
      }
    }
    ops.push_back(binOp);
    opToks.push_back(opTok);
    comps.emplace_back(parseBitwiseOr());
  }
  if (ops.empty()) { return left; }
  if (ops.size() == 1) {
    // single comparator stays a Binary
    return stamp(std::make_unique<ast::Binary>(ops[0], std::move(left), std::move(comps[0])), opToks[0]);
  }
  auto cmp = stamp(std::make_unique<ast::Compare>(), opToks[0]);
  cmp->left = std::move(left);
  cmp->ops = std::move(ops);
  cmp->comparators = std::move(comps);
  for (const auto& t : opToks) { cmp->opPositions.emplace_back(t.line, t.col); }
  return cmp;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseOr() {
  auto lhs = parseBitwiseXor();
  while (peek().kind == TK::Pipe) {
    auto tok = get();
    auto rhs = parseBitwiseXor();
    lhs = stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::BitOr, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseXor() {
  auto lhs = parseBitwiseAnd();
  while (peek().kind == TK::Caret) {
    auto tok = get();
    auto rhs = parseBitwiseAnd();
    lhs = stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::BitXor, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseBitwiseAnd() {
  auto lhs = parseShift();
  while (peek().kind == TK::Amp) {
    auto tok = get();
    auto rhs = parseShift();
    lhs = stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::BitAnd, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseShift() {
  auto lhs = parseAdditive();
  while (peek().kind == TK::LShift || peek().kind == TK::RShift) {
    auto tok = get();
    auto rhs = parseAdditive();
    auto op = (tok.kind == TK::LShift) ? ast::BinaryOperator::LShift : ast::BinaryOperator::RShift;
    lhs = stamp(std::make_unique<ast::Binary>(op, std::move(lhs), std::move(rhs)), tok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseAdditive() {
  auto lhs = parseMultiplicative();
  while (peek().kind == TK::Plus || peek().kind == TK::Minus) {
    auto opTok = get();
    auto rhs = parseMultiplicative();
    const ast::BinaryOperator binOp = (opTok.kind == TK::Plus) ? ast::BinaryOperator::Add : ast::BinaryOperator::Sub;
    lhs = stamp(std::make_unique<ast::Binary>(binOp, std::move(lhs), std::move(rhs)), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseMultiplicative() {
  auto lhs = parseUnary();
  for (;;) {
    const auto kind = peek().kind;
    if (!(kind == TK::Star || kind == TK::Slash || kind == TK::Percent || kind == TK::SlashSlash)) { break; }
    auto opTok = get();
    auto rhs = parseUnary();
    lhs = stamp(std::make_unique<ast::Binary>(mulOpFor(opTok.kind), std::move(lhs), std::move(rhs)), opTok);
  }
  return lhs;
}

std::unique_ptr<ast::Expr> Parser::parseUnary() {
  const auto kind = peek().kind;
  if (kind == TK::Minus || kind == TK::Plus) {
    auto signTok = get();
    auto operand = parseUnary();
    const bool neg = (signTok.kind == TK::Minus);
    if (neg && peek().kind == TK::Int) {
      const auto after = peekNext().kind;
      if (after != TK::StarStar && after != TK::LParen && after != TK::LBracket && after != TK::Dot) {
        const auto numTok = get();
        auto lit = parseIntLiteral(numTok, true);
        lit->line = signTok.line; lit->col = signTok.col; lit->file = signTok.file;
        return lit;
      }
    }
    // Fold a sign applied directly to a numeric literal
    if (operand->kind == ast::NodeKind::IntLiteral) {
      auto* lit = static_cast<ast::IntLiteral*>(operand.get());
      if (neg && lit->value == std::numeric_limits<int64_t>::min()) {
        throw syntaxError(signTok, "integer literal out of range");
      }
      return stamp(std::make_unique<ast::IntLiteral>(neg ? -lit->value : lit->value), signTok);
    }
    if (operand->kind == ast::NodeKind::FloatLiteral) {
      auto* lit = static_cast<ast::FloatLiteral*>(operand.get());
      return stamp(std::make_unique<ast::FloatLiteral>(neg ? -lit->value : lit->value), signTok);
    }
    const auto op = neg ? ast::UnaryOperator::Neg : ast::UnaryOperator::Pos;
    return stamp(std::make_unique<ast::Unary>(op, std::move(operand)), signTok);
  }
  if (kind == TK::Tilde) {
    auto tok = get();
    auto operand = parseUnary();
    return stamp(std::make_unique<ast::Unary>(ast::UnaryOperator::BitNot, std::move(operand)), tok);
  }
  return parsePower();
}

std::unique_ptr<ast::Expr> Parser::parsePower() {
  auto base = parsePostfix(parsePrimary());
  if (peek().kind == TK::StarStar) {
    auto tok = get();
    auto exponent = parseUnary(); // right-associative, binds tighter than a unary on its left
    return stamp(std::make_unique<ast::Binary>(ast::BinaryOperator::Pow, std::move(base), std::move(exponent)), tok);
  }
  return base;
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
std::unique_ptr<ast::Expr> Parser::parsePrimary() {
  const auto tok = get();
  switch (tok.kind) {
    case TK::Int: return parseIntLiteral(tok);
    case TK::Float: return parseFloatLiteral(tok);
    case TK::String: return parseStringAtom(tok);
    case TK::Ident: return stamp(std::make_unique<ast::Name>(tok.text), tok);
    case TK::BoolLit: return stamp(std::make_unique<ast::BoolLiteral>(tok.text == "True"), tok);
    case TK::NoneLit: return stamp(std::make_unique<ast::NoneLiteral>(), tok);
    case TK::LParen: return parseTupleOrParen(tok);
    case TK::LBracket: return parseListLiteral(tok);
    case TK::LBrace: return parseDictOrSetLiteral(tok);
    case TK::Lambda: pos_--; return parseLambda();
    case TK::Reserved: throw unsupported(tok, "'" + tok.text + "' expression");
    default: break;
  }
  --pos_;
  recordExpectation("expression");
  throw syntaxError(tok, "expected expression, got " + friendlyText(tok));
}

std::unique_ptr<ast::Expr> Parser::parsePostfix(std::unique_ptr<ast::Expr> base) {
  for (;;) {
    if (peek().kind == TK::LParen) {
      get();
      auto argres = parseArgList();
      const int line = base->line; const int col = base->col; const std::string file = base->file;
      auto call = std::make_unique<ast::Call>(std::move(base));
      call->line = line; call->col = col; call->file = file;
      call->args = std::move(argres.positional);
      call->keywords = std::move(argres.keywords);
      call->starArgs = std::move(argres.starArgs);
      call->kwStarArgs = std::move(argres.kwStarArgs);
      base = std::move(call);
      continue;
    }
    if (peek().kind == TK::Dot) {
      const auto dotTok = get();
      const auto nm = get();
      if (nm.kind != TK::Ident) { --pos_; recordExpectation("attribute name"); throw syntaxError(nm, "expected attribute name"); }
      base = stamp(std::make_unique<ast::Attribute>(std::move(base), nm.text), dotTok);
      continue;
    }
    if (peek().kind == TK::LBracket) {
      const auto openTok = get();
      auto slice = parseSubscriptSlice();
      expect(TK::RBracket, "']'");
      base = stamp(std::make_unique<ast::Subscript>(std::move(base), std::move(slice)), openTok);
      continue;
    }
    break;
  }
  return base;
}

// a[b], a[b:c:d], a[b, c] -> slice parts become a TupleLiteral with None placeholders
std::unique_ptr<ast::Expr> Parser::parseSubscriptSlice() {
  const auto startTok = peek();
  std::unique_ptr<ast::Expr> first;
  if (peek().kind != TK::Colon) {
    if (peek().kind == TK::RBracket) { recordExpectation("subscript"); throw syntaxError(peek(), "expected subscript"); }
    first = parseExpr();
  }
  if (peek().kind == TK::Colon) {
    auto tup = stamp(std::make_unique<ast::TupleLiteral>(), startTok);
    tup->elements.emplace_back(first ? std::move(first) : stamp(std::make_unique<ast::NoneLiteral>(), startTok));
    for (int part = 0; part < 2 && peek().kind == TK::Colon; ++part) {
      const auto colonTok = get();
      if (peek().kind != TK::Colon && peek().kind != TK::RBracket) { tup->elements.emplace_back(parseExpr()); }
      else { tup->elements.emplace_back(stamp(std::make_unique<ast::NoneLiteral>(), colonTok)); }
    }
    return tup;
  }
  if (peek().kind == TK::Comma) {
    auto tup = stamp(std::make_unique<ast::TupleLiteral>(), startTok);
    tup->elements.emplace_back(std::move(first));
    while (peek().kind == TK::Comma) {
      get();
      if (peek().kind == TK::RBracket) break;
      tup->elements.emplace_back(parseExpr());
    }
    return tup;
  }
  return first;
}

// Helpers
std::string Parser::unquoteString(const std::string& text, bool& isRaw) {
  size_t i = 0;
  isRaw = false;
  while (i < text.size() && text[i] != '\'' && text[i] != '"') {
    if (text[i] == 'r' || text[i] == 'R') { isRaw = true; }
    ++i;
  }
  if (i >= text.size()) return {};
  const char q = text[i];
  const bool triple = (i + 2 < text.size() && text[i + 1] == q && text[i + 2] == q);
  const size_t quoteLen = triple ? 3 : 1;
  const size_t start = i + quoteLen;
  if (text.size() < start + quoteLen) return {};
  return text.substr(start, text.size() - quoteLen - start);
}

std::string Parser::decodeEscapes(const std::string& body) {
  std::string out;
  out.reserve(body.size());
  for (size_t i = 0; i < body.size(); ++i) {
    const char c = body[i];
    if (c != '\\' || i + 1 >= body.size()) { out.push_back(c); continue; }
    const char n = body[++i];
    switch (n) {
      case 'n': out.push_back('\n'); break;
      case 't': out.push_back('\t'); break;
      case 'r': out.push_back('\r'); break;
      case '0': out.push_back('\0'); break;
      case '\\': out.push_back('\\'); break;
      case '\'': out.push_back('\''); break;
      case '"': out.push_back('"'); break;
      case 'x':
        if (i + 2 < body.size() && std::isxdigit(static_cast<unsigned char>(body[i + 1])) != 0 &&
            std::isxdigit(static_cast<unsigned char>(body[i + 2])) != 0) {
          out.push_back(static_cast<char>(std::stoi(body.substr(i + 1, 2), nullptr, 16)));
          i += 2;
          break;
        }
        out.push_back('\\'); out.push_back(n);
        break;
      default:
        // unknown escapes keep their backslash
        out.push_back('\\'); out.push_back(n);
        break;
    }
  }
  return out;
}

// Adjacent string literals concatenate; any f-prefix makes the whole atom an f-string
std::unique_ptr<ast::Expr> Parser::parseStringAtom(const lex::Token& first) {
  std::string value;
  bool anyF = false;
  auto absorb = [&](const lex::Token& tok) {
    bool isBytes = false;
    bool isF = false;
    for (const char c : tok.text) {
      if (c == '\'' || c == '"') break;
      if (c == 'b' || c == 'B') isBytes = true;
      if (c == 'f' || c == 'F') isF = true;
    }
    if (isBytes) { throw unsupported(tok, "bytes literal"); }
    bool isRaw = false;
    const std::string body = unquoteString(tok.text, isRaw);
    anyF = anyF || isF;
    value += (isRaw || isF) ? body : decodeEscapes(body);
  };
  absorb(first);
  while (peek().kind == TK::String) { absorb(get()); }
  if (anyF) { return stamp(std::make_unique<ast::FStringLiteral>(value), first); }
  return stamp(std::make_unique<ast::StringLiteral>(value), first);
}

std::unique_ptr<ast::Expr> Parser::parseIntLiteral(const lex::Token& tok, bool negated) const {
  std::string digits;
  for (const char c : tok.text) { if (c != '_') digits.push_back(c); }
  int base = 10;
  if (digits.size() > 2 && digits[0] == '0') {
    const char p = static_cast<char>(std::tolower(static_cast<unsigned char>(digits[1])));
    if (p == 'x') { base = 16; } else if (p == 'o') { base = 8; } else if (p == 'b') { base = 2; }
    if (base != 10) { digits = digits.substr(2); }
  }
  if (base == 10 && digits.size() > 1 && digits[0] == '0' && digits.find_first_not_of('0') != std::string::npos) {
    throw syntaxError(tok, "leading zeros in decimal integer literals are not permitted");
  }
  constexpr uint64_t kMinMagnitude = uint64_t{1} << 63U;
  uint64_t magnitude = 0;
  try {
    magnitude = std::stoull(digits, nullptr, base);
  } catch (const std::out_of_range&) {
    throw syntaxError(tok, "integer literal out of range");
  }
  if (magnitude > (negated ? kMinMagnitude : kMinMagnitude - 1)) {
    throw syntaxError(tok, "integer literal out of range");
  }
  int64_t v = static_cast<int64_t>(magnitude);
  if (negated) { v = magnitude == kMinMagnitude ? std::numeric_limits<int64_t>::min() : -v; }
  return stamp(std::make_unique<ast::IntLiteral>(v), tok);
}

std::unique_ptr<ast::Expr> Parser::parseFloatLiteral(const lex::Token& tok) const {
  std::string digits;
  for (const char c : tok.text) { if (c != '_') digits.push_back(c); }
  // Underflow rounds toward zero; only overflow is an error
  errno = 0;
  const double v = std::strtod(digits.c_str(), nullptr);
  if (errno == ERANGE && (v == HUGE_VAL || v == -HUGE_VAL)) {
    throw syntaxError(tok, "float literal out of range");
  }
  return stamp(std::make_unique<ast::FloatLiteral>(v), tok);
}

void Parser::rejectComprehension() {
  if (peek().kind == TK::For) { throw unsupported(peek(), "comprehension"); }
}

std::unique_ptr<ast::Expr> Parser::parseListLiteral(const lex::Token& openTok) {
  auto list = stamp(std::make_unique<ast::ListLiteral>(), openTok);
  if (match(TK::RBracket)) { return list; }
  list->elements.emplace_back(parseExpr());
  rejectComprehension();
  while (peek().kind == TK::Comma) {
    get();
    if (peek().kind == TK::RBracket) break;
    list->elements.emplace_back(parseExpr());
  }
  expect(TK::RBracket, "']'");
  return list;
}

std::unique_ptr<ast::Expr> Parser::parseTupleOrParen(const lex::Token& openTok) {
  if (match(TK::RParen)) { return stamp(std::make_unique<ast::TupleLiteral>(), openTok); }
  auto first = parseExpr();
  rejectComprehension();
  if (peek().kind != TK::Comma) { expect(TK::RParen, "')'"); return first; }
  auto tup = stamp(std::make_unique<ast::TupleLiteral>(), openTok);
  tup->elements.emplace_back(std::move(first));
  while (peek().kind == TK::Comma) {
    get();
    if (peek().kind == TK::RParen) { break; }
    tup->elements.emplace_back(parseExpr());
  }
  expect(TK::RParen, "')'");
  return tup;
}

// Parse a brace literal: dict or set
std::unique_ptr<ast::Expr> Parser::parseDictOrSetLiteral(const lex::Token& openTok) {
  // '{}' -> empty dict
  if (match(TK::RBrace)) { return stamp(std::make_unique<ast::DictLiteral>(), openTok); }
  if (peek().kind == TK::StarStar) { throw unsupported(peek(), "dict unpacking"); }
  auto first = parseExpr();
  if (match(TK::Colon)) {
    auto dict = stamp(std::make_unique<ast::DictLiteral>(), openTok);
    auto firstVal = parseExpr();
    rejectComprehension();
    dict->items.emplace_back(std::move(first), std::move(firstVal));
    while (peek().kind == TK::Comma) {
      get();
      if (peek().kind == TK::RBrace) break;
      auto k = parseExpr(); expect(TK::Colon, "':'"); auto v = parseExpr();
      dict->items.emplace_back(std::move(k), std::move(v));
    }
    expect(TK::RBrace, "'}'");
    return dict;
  }
  rejectComprehension();
  auto set = stamp(std::make_unique<ast::SetLiteral>(), openTok);
  set->elements.emplace_back(std::move(first));
  while (peek().kind == TK::Comma) { get(); if (peek().kind == TK::RBrace) break; set->elements.emplace_back(parseExpr()); }
  expect(TK::RBrace, "'}'");
  return set;
}

Parser::ArgList Parser::parseArgList() {
  ArgList out;
  bool seenKeyword = false;
  std::set<std::string> seenNames;
  if (peek().kind != TK::RParen) {
    for (;;) {
      if (peek().kind == TK::StarStar) {
        get(); out.kwStarArgs.emplace_back(parseExpr());
        seenKeyword = true;
      } else if (peek().kind == TK::Star) {
        get(); out.starArgs.emplace_back(parseExpr());
      } else if (peek().kind == TK::Ident && peekNext().kind == TK::Equal) {
        const auto nameTok = get(); get(); // consume '='
        if (!seenNames.insert(nameTok.text).second) {
          throw syntaxError(nameTok, "keyword argument repeated: '" + nameTok.text + "'");
        }
        ast::KeywordArg kw{nameTok.text, parseExpr(), nameTok.line, nameTok.col};
        out.keywords.emplace_back(std::move(kw));
        seenKeyword = true;
      } else {
        const auto argTok = peek();
        if (seenKeyword) { throw syntaxError(argTok, "positional argument follows keyword argument"); }
        out.positional.emplace_back(parseExpr());
        rejectComprehension();
      }
      if (peek().kind != TK::Comma) break;
      get();
      if (peek().kind == TK::RParen) break; // allow trailing comma
    }
  }
  expect(TK::RParen, "')'");
  return out;
}

ast::BinaryOperator Parser::mulOpFor(lex::TokenKind kind) {
  switch (kind) {
    case TK::Star: return ast::BinaryOperator::Mul;
    case TK::Slash: return ast::BinaryOperator::Div;
    case TK::SlashSlash: return ast::BinaryOperator::FloorDiv;
    case TK::Percent: return ast::BinaryOperator::Mod;
    default: return ast::BinaryOperator::Mul;
  }
}

bool Parser::augOpFor(lex::TokenKind kind, ast::BinaryOperator& out) {
  switch (kind) {
    case TK::PlusEqual: out = ast::BinaryOperator::Add; return true;
    case TK::MinusEqual: out = ast::BinaryOperator::Sub; return true;
    case TK::StarEqual: out = ast::BinaryOperator::Mul; return true;
    case TK::SlashEqual: out = ast::BinaryOperator::Div; return true;
    case TK::SlashSlashEqual: out = ast::BinaryOperator::FloorDiv; return true;
    case TK::PercentEqual: out = ast::BinaryOperator::Mod; return true;
    case TK::StarStarEqual: out = ast::BinaryOperator::Pow; return true;
    case TK::LShiftEqual: out = ast::BinaryOperator::LShift; return true;
    case TK::RShiftEqual: out = ast::BinaryOperator::RShift; return true;
    case TK::AmpEqual: out = ast::BinaryOperator::BitAnd; return true;
    case TK::PipeEqual: out = ast::BinaryOperator::BitOr; return true;
    case TK::CaretEqual: out = ast::BinaryOperator::BitXor; return true;
    default: return false;
  }
}

bool Parser::isValidAssignmentTarget(const ast::Expr* e) {
  if (!e) return false;
  using NK = ast::NodeKind;
  switch (e->kind) {
    case NK::Name:
    case NK::Attribute:
    case NK::Subscript:
      return true;
    case NK::TupleLiteral: {
      const auto* tup = static_cast<const ast::TupleLiteral*>(e);
      for (const auto& el : tup->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return !tup->elements.empty();
    }
    case NK::ListLiteral: {
      const auto* lst = static_cast<const ast::ListLiteral*>(e);
      for (const auto& el : lst->elements) {
        if (!isValidAssignmentTarget(el.get())) return false;
      }
      return true;
    }
    default:
      return false;
  }
}

bool Parser::hasPendingEqualOnLine() const {
  int depth = 0;
  for (size_t i = pos_; i < tokens_.size(); ++i) {
    const auto& t = tokens_[i];
    if (t.kind == TK::End || t.kind == TK::Newline || t.kind == TK::Semicolon) return false;
    if (t.kind == TK::Colon && depth == 0) return false;
    if (t.kind == TK::Lambda && depth == 0) return false;
    if (t.kind == TK::LParen || t.kind == TK::LBracket || t.kind == TK::LBrace) { ++depth; continue; }
    if (t.kind == TK::RParen || t.kind == TK::RBracket || t.kind == TK::RBrace) { if (depth > 0) --depth; continue; }
    if (t.kind == TK::Equal && depth == 0) return true;
  }
  return false;
}

bool Parser::hasPendingAugAssignOnLine(lex::TokenKind& which) const {
  int depth = 0;
  ast::BinaryOperator ignored{};
  for (size_t i = pos_; i < tokens_.size(); ++i) {
    const auto& t = tokens_[i];
    if (t.kind == TK::End || t.kind == TK::Newline || t.kind == TK::Semicolon) return false;
    if (t.kind == TK::Colon && depth == 0) return false;
    if (t.kind == TK::Equal && depth == 0) return false;
    if (t.kind == TK::LParen || t.kind == TK::LBracket || t.kind == TK::LBrace) { ++depth; continue; }
    if (t.kind == TK::RParen || t.kind == TK::RBracket || t.kind == TK::RBrace) { if (depth > 0) --depth; continue; }
    if (depth == 0 && augOpFor(t.kind, ignored)) { which = t.kind; return true; }
  }
  return false;
}

} // namespace exprguard::parse
