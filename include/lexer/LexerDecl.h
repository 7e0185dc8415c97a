/**
 * Name: exprguard::lex::Lexer
 * Purpose: Tokenize expression text from a stack of input sources (LIFO).
 * Theory of Operation:
 *   Inputs are read line by line and tokenized eagerly on first access.
 *   Newlines become statement terminators only outside (), [] and {};
 *   indentation carries no meaning. Malformed text raises SyntaxError.
 */
#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "lexer/ITokenStream.h"
#include "lexer/InputSource.h"
#include "exprguard/exceptions/syntax_error.h"

namespace exprguard::lex {

class Lexer : public ITokenStream {
public:
    Lexer() = default;

    void pushString(const std::string& text, const std::string& name);

    // ITokenStream
    const Token& peek(size_t lookahead = 0) override;

    Token next() override;

    std::vector<Token> tokens();

    // Source lines read so far for an input name (used for error context)
    const std::vector<std::string>* sourceLines(const std::string& name) const;

private:
    bool finalized_{false};
    std::vector<Token> tokens_{};
    size_t pos_{0};
    int depth_{0}; // open bracket nesting across lines

    struct State {
        std::unique_ptr<InputSource> src;
        std::string line;
        size_t index{0};
        int lineNo{0};
        bool joinNext{false}; // trailing backslash continues the line
    };

    std::vector<State> stack_{}; // LIFO of inputs
    std::map<std::string, std::vector<std::string>> lines_{};

    bool readNextLine(State& state);
    bool scanOne(State& state, Token& out); // false when the line is exhausted
    exceptions::SyntaxError error(const State& state, size_t col0, size_t width, const std::string& msg) const;

    void buildAll(); // build tokens_ from all inputs (LIFO)
};

} // namespace exprguard::lex
