/**
 * @file
 * @brief AST declarations.
 */
#pragma once
#include <cstddef>
#include <memory>

#include "BinaryOperator.h"
#include "Expr.h"

namespace exprguard::ast {
    // Arithmetic, bitwise, single comparison, and the boolean 'and'/'or'.
    struct Binary final : Expr {
        BinaryOperator op;
        std::unique_ptr<Expr> lhs;
        std::unique_ptr<Expr> rhs;
        // 'and'/'or' only: operands in the unparenthesized chain ending here
        size_t operands{2};

        Binary(const BinaryOperator o, std::unique_ptr<Expr> a, std::unique_ptr<Expr> b)
            : Expr(NodeKind::BinaryExpr), op(o), lhs(std::move(a)), rhs(std::move(b)) {
        }
    };
} // namespace exprguard::ast
