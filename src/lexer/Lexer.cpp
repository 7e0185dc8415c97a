/***
 * Name: exprguard::lex::Lexer
 * Purpose: Tokenize expression text(s) into a single token stream (LIFO inputs).
 */
#include "lexer/Lexer.h"
#include <cctype>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "exprguard/exceptions/unsupported_construct.h"

namespace exprguard::lex {

static bool isIdentStart(char chr) { return (std::isalpha(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }
static bool isIdentChar(char chr) { return (std::isalnum(static_cast<unsigned char>(chr)) != 0) || chr == '_'; }

static TokenKind keywordKind(const std::string& ident) {
  static const std::unordered_map<std::string, TokenKind> kKeywords = {
      {"if", TokenKind::If},         {"else", TokenKind::Else},     {"elif", TokenKind::Elif},
      {"while", TokenKind::While},   {"for", TokenKind::For},       {"in", TokenKind::In},
      {"return", TokenKind::Return}, {"pass", TokenKind::Pass},     {"lambda", TokenKind::Lambda},
      {"and", TokenKind::And},       {"or", TokenKind::Or},         {"not", TokenKind::Not},
      {"is", TokenKind::Is},         {"True", TokenKind::BoolLit},  {"False", TokenKind::BoolLit},
      {"None", TokenKind::NoneLit},
      // statement keywords with no place in a formula
      {"def", TokenKind::Reserved},      {"class", TokenKind::Reserved},  {"import", TokenKind::Reserved},
      {"from", TokenKind::Reserved},     {"try", TokenKind::Reserved},    {"except", TokenKind::Reserved},
      {"finally", TokenKind::Reserved},  {"with", TokenKind::Reserved},   {"as", TokenKind::Reserved},
      {"raise", TokenKind::Reserved},    {"global", TokenKind::Reserved}, {"nonlocal", TokenKind::Reserved},
      {"assert", TokenKind::Reserved},   {"del", TokenKind::Reserved},    {"yield", TokenKind::Reserved},
      {"await", TokenKind::Reserved},    {"async", TokenKind::Reserved},  {"break", TokenKind::Reserved},
      {"continue", TokenKind::Reserved},
  };
  const auto it = kKeywords.find(ident);
  return it == kKeywords.end() ? TokenKind::Ident : it->second;
}

// StringInput implementation
StringInput::StringInput(std::string text, std::string name)
  : name_(std::move(name)), in_(nullptr) {
  auto iss = std::make_unique<std::istringstream>(std::move(text));
  in_ = std::move(iss);
}

bool StringInput::getline(std::string& out) {
  if (!in_ || !(*in_)) { return false; }
  if (!std::getline(*in_, out)) { return false; }
  return true;
}


void Lexer::pushString(const std::string& text, const std::string& name) {
  State state;
  state.src = std::make_unique<StringInput>(text, name);
  state.lineNo = 0;
  state.index = 0;
  stack_.push_back(std::move(state));
}

const std::vector<std::string>* Lexer::sourceLines(const std::string& name) const {
  const auto it = lines_.find(name);
  return it == lines_.end() ? nullptr : &it->second;
}

exceptions::SyntaxError Lexer::error(const State& state, const size_t col0, const size_t width,
                                     const std::string& msg) const {
  const int col = static_cast<int>(col0 + 1);
  return exceptions::SyntaxError(
      formatContext(state.src->name(), state.lineNo, col, width, msg, &state.line), state.lineNo, col);
}

bool Lexer::readNextLine(State& state) {
  state.line.clear();
  if (!state.src->getline(state.line)) { return false; }
  ++state.lineNo;
  state.index = 0;
  // Handle CRLF
  if (!state.line.empty() && state.line.back() == '\r') { state.line.pop_back(); }
  lines_[state.src->name()].push_back(state.line);
  state.joinNext = false;
  return true;
}

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
bool Lexer::scanOne(State& state, Token& out) {
  auto& line = state.line;
  size_t& idx = state.index;

  while (idx < line.size() && (line[idx] == ' ' || line[idx] == '\t' || line[idx] == '\f')) { ++idx; }
  if (idx >= line.size()) { return false; }
  // Comment: rest of line is ignored
  if (line[idx] == '#') { idx = line.size(); return false; }

  auto makeTok = [&](TokenKind kind, size_t start, size_t endExclusive) {
    out.kind = kind;
    out.text = line.substr(start, endExclusive - start);
    out.file = state.src->name();
    out.line = state.lineNo;
    out.col = static_cast<int>(start + 1);
    idx = endExclusive;
    return true;
  };
  auto at = [&](size_t pos, char c) { return pos < line.size() && line[pos] == c; };

  const char chr = line[idx];
  if (chr == '\\') {
    if (idx + 1 == line.size()) { state.joinNext = true; idx = line.size(); return false; }
    throw error(state, idx, 1, "unexpected character after line continuation");
  }
  if (chr == '(') { ++depth_; return makeTok(TokenKind::LParen, idx, idx + 1); }
  if (chr == ')') { if (depth_ > 0) { --depth_; } return makeTok(TokenKind::RParen, idx, idx + 1); }
  if (chr == '[') { ++depth_; return makeTok(TokenKind::LBracket, idx, idx + 1); }
  if (chr == ']') { if (depth_ > 0) { --depth_; } return makeTok(TokenKind::RBracket, idx, idx + 1); }
  if (chr == '{') { ++depth_; return makeTok(TokenKind::LBrace, idx, idx + 1); }
  if (chr == '}') { if (depth_ > 0) { --depth_; } return makeTok(TokenKind::RBrace, idx, idx + 1); }
  if (chr == ';') { return makeTok(TokenKind::Semicolon, idx, idx + 1); }
  if (chr == ':') {
    if (at(idx + 1, '=')) { return makeTok(TokenKind::ColonEqual, idx, idx + 2); }
    return makeTok(TokenKind::Colon, idx, idx + 1);
  }
  if (chr == ',') { return makeTok(TokenKind::Comma, idx, idx + 1); }
  if (chr == '+') {
    if (at(idx + 1, '=')) { return makeTok(TokenKind::PlusEqual, idx, idx + 2); }
    return makeTok(TokenKind::Plus, idx, idx + 1);
  }

  auto scanStringLike = [&](size_t start) -> bool {
    size_t p = start;
    while (p < line.size() && line[p] != '\'' && line[p] != '"') { ++p; }
    const char quote = line[p];
    const bool triple = at(p + 1, quote) && at(p + 2, quote);
    size_t endPos = p + (triple ? 3 : 1);
    bool closed = false;
    bool escape = false;
    for (; endPos < line.size(); ++endPos) {
      const char c = line[endPos];
      if (escape) { escape = false; continue; }
      if (c == '\\') { escape = true; continue; }
      if (c != quote) { continue; }
      if (!triple) { closed = true; ++endPos; break; }
      if (at(endPos + 1, quote) && at(endPos + 2, quote)) { closed = true; endPos += 3; break; }
    }
    if (!closed) {
      throw error(state, start, line.size() - start,
                  triple ? "unterminated triple-quoted string (strings must fit on one line)"
                         : "unterminated string literal");
    }
    return makeTok(TokenKind::String, start, endPos);
  };
  if (chr == '"' || chr == '\'') { return scanStringLike(idx); }
  // prefixes: b/B, f/F, r/R, u/U and two-letter combos; the parser interprets them
  if (chr == 'b' || chr == 'B' || chr == 'f' || chr == 'F' || chr == 'r' || chr == 'R' || chr == 'u' || chr == 'U') {
    size_t p = idx; int cnt = 0;
    while (cnt < 2 && p < line.size()) {
      const char c = line[p];
      if (!(c == 'b' || c == 'B' || c == 'f' || c == 'F' || c == 'r' || c == 'R' || c == 'u' || c == 'U')) { break; }
      ++p; ++cnt;
    }
    if (p < line.size() && (line[p] == '\'' || line[p] == '"')) { return scanStringLike(idx); }
  }
  if (chr == '-') {
    if (at(idx + 1, '=')) { return makeTok(TokenKind::MinusEqual, idx, idx + 2); }
    return makeTok(TokenKind::Minus, idx, idx + 1);
  }
  if (chr == '*') {
    if (at(idx + 1, '*')) {
      if (at(idx + 2, '=')) { return makeTok(TokenKind::StarStarEqual, idx, idx + 3); }
      return makeTok(TokenKind::StarStar, idx, idx + 2);
    }
    if (at(idx + 1, '=')) { return makeTok(TokenKind::StarEqual, idx, idx + 2); }
    return makeTok(TokenKind::Star, idx, idx + 1);
  }
  if (chr == '/') {
    if (at(idx + 1, '/')) {
      if (at(idx + 2, '=')) { return makeTok(TokenKind::SlashSlashEqual, idx, idx + 3); }
      return makeTok(TokenKind::SlashSlash, idx, idx + 2);
    }
    if (at(idx + 1, '=')) { return makeTok(TokenKind::SlashEqual, idx, idx + 2); }
    return makeTok(TokenKind::Slash, idx, idx + 1);
  }
  if (chr == '%') { if (at(idx + 1, '=')) { return makeTok(TokenKind::PercentEqual, idx, idx + 2); } return makeTok(TokenKind::Percent, idx, idx + 1); }
  if (chr == '=') { if (at(idx + 1, '=')) { return makeTok(TokenKind::EqEq, idx, idx + 2); } return makeTok(TokenKind::Equal, idx, idx + 1); }
  if (chr == '!') {
    if (at(idx + 1, '=')) { return makeTok(TokenKind::NotEq, idx, idx + 2); }
    throw error(state, idx, 1, "unexpected character '!'");
  }
  if (chr == '<') {
    if (at(idx + 1, '<')) {
      if (at(idx + 2, '=')) { return makeTok(TokenKind::LShiftEqual, idx, idx + 3); }
      return makeTok(TokenKind::LShift, idx, idx + 2);
    }
    if (at(idx + 1, '=')) { return makeTok(TokenKind::Le, idx, idx + 2); }
    return makeTok(TokenKind::Lt, idx, idx + 1);
  }
  if (chr == '>') {
    if (at(idx + 1, '>')) {
      if (at(idx + 2, '=')) { return makeTok(TokenKind::RShiftEqual, idx, idx + 3); }
      return makeTok(TokenKind::RShift, idx, idx + 2);
    }
    if (at(idx + 1, '=')) { return makeTok(TokenKind::Ge, idx, idx + 2); }
    return makeTok(TokenKind::Gt, idx, idx + 1);
  }
  if (chr == '|') { if (at(idx + 1, '=')) { return makeTok(TokenKind::PipeEqual, idx, idx + 2); } return makeTok(TokenKind::Pipe, idx, idx + 1); }
  if (chr == '&') { if (at(idx + 1, '=')) { return makeTok(TokenKind::AmpEqual, idx, idx + 2); } return makeTok(TokenKind::Amp, idx, idx + 1); }
  if (chr == '^') { if (at(idx + 1, '=')) { return makeTok(TokenKind::CaretEqual, idx, idx + 2); } return makeTok(TokenKind::Caret, idx, idx + 1); }
  if (chr == '~') { return makeTok(TokenKind::Tilde, idx, idx + 1); }

  auto isDecDigit = [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; };
  auto isHexDigit = [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; };
  auto isBinDigit = [](char c) { return c == '0' || c == '1'; };
  auto isOctDigit = [](char c) { return c >= '0' && c <= '7'; };
  auto scanDigitsUnderscore = [&](size_t pos, auto isOk) {
    size_t i = pos; bool have = false; bool prevUnderscore = false;
    while (i < line.size()) {
      const char c = line[i];
      if (isOk(c)) { have = true; prevUnderscore = false; ++i; continue; }
      if (c == '_' && have && !prevUnderscore) { prevUnderscore = true; ++i; continue; }
      break;
    }
    if (prevUnderscore) { --i; } // trim trailing underscore
    return i;
  };
  auto scanExponent = [&](size_t pos) -> size_t {
    if (!(at(pos, 'e') || at(pos, 'E'))) { return pos; }
    size_t i = pos + 1;
    if (at(i, '+') || at(i, '-')) { ++i; }
    const size_t end = scanDigitsUnderscore(i, isDecDigit);
    return end == i ? pos : end; // back out if no digits
  };
  // Finish a numeric token; reject trailing identifier characters and imaginary suffixes
  auto finishNumber = [&](TokenKind kind, size_t start, size_t end) -> bool {
    if (at(end, 'j') || at(end, 'J')) {
      throw exceptions::UnsupportedConstruct(
          "imaginary literal",
          formatContext(state.src->name(), state.lineNo, static_cast<int>(start + 1), end + 1 - start,
                        "imaginary literals are not supported", &line),
          state.lineNo, static_cast<int>(start + 1));
    }
    if (end < line.size() && isIdentChar(line[end])) {
      throw error(state, start, end + 1 - start, "invalid numeric literal");
    }
    return makeTok(kind, start, end);
  };
  if (isDecDigit(chr) || (chr == '.' && idx + 1 < line.size() && isDecDigit(line[idx + 1]))) {
    const size_t i0 = idx;
    if (chr == '0' && idx + 1 < line.size()) {
      const char p1 = line[idx + 1];
      if (p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O' || p1 == 'x' || p1 == 'X') {
        size_t p = idx + 2;
        if (p1 == 'b' || p1 == 'B') { p = scanDigitsUnderscore(p, isBinDigit); }
        else if (p1 == 'o' || p1 == 'O') { p = scanDigitsUnderscore(p, isOctDigit); }
        else { p = scanDigitsUnderscore(p, isHexDigit); }
        if (p == idx + 2) { throw error(state, i0, 2, "invalid numeric literal"); }
        return finishNumber(TokenKind::Int, i0, p);
      }
    }
    const size_t p = chr == '.' ? idx : scanDigitsUnderscore(idx, isDecDigit);
    if (at(p, '.')) {
      const size_t fracEnd = scanDigitsUnderscore(p + 1, isDecDigit);
      return finishNumber(TokenKind::Float, i0, scanExponent(fracEnd));
    }
    const size_t epos = scanExponent(p);
    if (epos != p) { return finishNumber(TokenKind::Float, i0, epos); }
    return finishNumber(TokenKind::Int, i0, p);
  }
  if (chr == '.') { return makeTok(TokenKind::Dot, idx, idx + 1); }

  if (isIdentStart(chr)) {
    size_t jpos = idx + 1;
    while (jpos < line.size() && isIdentChar(line[jpos])) { ++jpos; }
    return makeTok(keywordKind(line.substr(idx, jpos - idx)), idx, jpos);
  }

  std::string msg = "unexpected character '";
  msg.push_back(chr);
  msg += "'";
  throw error(state, idx, 1, msg);
}

void Lexer::buildAll() {
  if (finalized_) { return; }
  finalized_ = true;
  // Process stack in LIFO order
  while (!stack_.empty()) {
    State state = std::move(stack_.back());
    stack_.pop_back();
    state.line.clear(); state.index = 0; state.lineNo = 0;
    depth_ = 0;
    while (readNextLine(state)) {
      Token tok;
      while (scanOne(state, tok)) { tokens_.push_back(tok); }
      // Newlines end statements only outside brackets and continuation lines
      if (depth_ == 0 && !state.joinNext) {
        Token newlineTok; newlineTok.kind = TokenKind::Newline; newlineTok.text = "\n"; newlineTok.file = state.src->name(); newlineTok.line = state.lineNo; newlineTok.col = static_cast<int>(state.line.size() + 1);
        tokens_.push_back(newlineTok);
      }
    }
  }
  // Final EOF
  Token eof; eof.kind = TokenKind::End; eof.text = "<EOF>"; eof.line = 0; eof.col = 1;
  if (!tokens_.empty()) {
    const Token& last = tokens_.back();
    eof.file = last.file; eof.line = last.line;
    eof.col = last.col + (last.kind == TokenKind::Newline ? 0 : static_cast<int>(last.text.size()));
  }
  tokens_.push_back(eof);
}

const Token& Lexer::peek(size_t lookahead) {
  if (!finalized_) { buildAll(); }
  if (pos_ + lookahead < tokens_.size()) {
    return tokens_[pos_ + lookahead];
  }
  return tokens_.back();
}

Token Lexer::next() {
  if (!finalized_) { buildAll(); }
  if (pos_ < tokens_.size()) {
    return tokens_[pos_++];
  }
  return tokens_.back();
}

std::vector<Token> Lexer::tokens() {
  if (!finalized_) { buildAll(); }
  return tokens_;
}

} // namespace exprguard::lex
