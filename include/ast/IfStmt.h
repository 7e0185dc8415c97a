#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"

namespace exprguard::ast {
    struct IfStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        explicit IfStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::IfStmt), cond(std::move(c)) {}
    };
} // namespace exprguard::ast
