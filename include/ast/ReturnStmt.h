/**
 * @file
 * @brief AST return statement declarations.
 */
#pragma once

#include <memory>
#include "ast/Expr.h"
#include "ast/Stmt.h"

namespace exprguard::ast {
    struct ReturnStmt final : Stmt {
        std::unique_ptr<Expr> value; // may be null
        explicit ReturnStmt(std::unique_ptr<Expr> v)
            : Stmt(NodeKind::ReturnStmt), value(std::move(v)) {}
    };

} // namespace exprguard::ast
