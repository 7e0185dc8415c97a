/**
 * Name: exprguard::lex::TokenKind
 * Purpose: Token kinds for the expression lexer.
 */
#pragma once

namespace exprguard::lex {

enum class TokenKind {
    End, // EOF
    Newline, // \n (only emitted outside brackets)
    Semicolon, // ; statement separator

    If, // if
    Else, // else
    Elif, // elif
    While, // while
    For, // for
    In, // in
    Return, // return
    Pass, // pass
    Lambda, // lambda
    And, // and
    Or, // or
    Not, // not
    Is, // is
    Reserved, // statement keyword outside the grammar (def, class, import, ...)

    Colon, // :
    ColonEqual, // := (named expression)
    Comma, // ,
    Dot, // .
    Equal, // =
    PlusEqual, // +=
    Plus, // +
    MinusEqual, // -=
    Minus, // -
    StarEqual, // *=
    Star, // *
    StarStarEqual, // **=
    StarStar, // ** (power)
    SlashEqual, // /=
    Slash, // /
    SlashSlashEqual, // //=
    SlashSlash, // // (floor-div)
    PercentEqual, // %=
    Percent, // %
    LShiftEqual, // <<=
    LShift, // <<
    RShiftEqual, // >>=
    RShift, // >>
    AmpEqual, // &=
    Amp, // &
    CaretEqual, // ^=
    Caret, // ^
    PipeEqual, // |=
    Pipe, // |
    Tilde, // ~
    EqEq, // ==
    NotEq, // !=
    Lt, // <
    Le, // <=
    Gt, // >
    Ge, // >=
    LParen, // (
    RParen, // )
    LBracket, // [
    RBracket, // ]
    LBrace, // {
    RBrace, // }

    Ident, // identifier
    Int, // integer literal
    Float, // float literal
    String, // string literal (text keeps prefix and quotes)
    BoolLit, // True/False
    NoneLit // None
};

// Convert TokenKind to a stable string for diagnostics/logging
const char* to_string(TokenKind k);

} // namespace exprguard::lex
