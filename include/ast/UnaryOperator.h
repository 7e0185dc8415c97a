/**
 * @file
 * @brief AST unary operator enumeration.
 */
#pragma once

namespace exprguard::ast {

enum class UnaryOperator {
    Neg,
    Pos,
    Not,
    BitNot
};

inline const char* to_symbol(const UnaryOperator op) {
    switch (op) {
        case UnaryOperator::Neg: return "-";
        case UnaryOperator::Pos: return "+";
        case UnaryOperator::Not: return "not";
        case UnaryOperator::BitNot: return "~";
    }
    return "?";
}

} // namespace exprguard::ast
