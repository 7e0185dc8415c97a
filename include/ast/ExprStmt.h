/***
 * Name: exprguard::ast::ExprStmt
 * Purpose: Represent a standalone expression as a statement.
 */
#pragma once

#include <memory>
#include "ast/Stmt.h"
#include "ast/Expr.h"

namespace exprguard::ast {

struct ExprStmt final : Stmt {
  std::unique_ptr<Expr> value;
  explicit ExprStmt(std::unique_ptr<Expr> v) : Stmt(NodeKind::ExprStmt), value(std::move(v)) {}
};

} // namespace exprguard::ast
