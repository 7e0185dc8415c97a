#pragma once

#include <memory>
#include "Expr.h"
#include "Stmt.h"
#include "ast/HasBodyPair.h"

namespace exprguard::ast {
    struct WhileStmt final : Stmt, HasBodyPair<Stmt> {
        std::unique_ptr<Expr> cond;
        explicit WhileStmt(std::unique_ptr<Expr> c) : Stmt(NodeKind::WhileStmt), cond(std::move(c)) {}
    };
}
