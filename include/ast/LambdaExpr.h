/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>
#include "ast/Expr.h"

namespace exprguard::ast {

struct LambdaExpr final : Expr {
  std::vector<std::string> params;
  std::unique_ptr<Expr> body;
  LambdaExpr() : Expr(NodeKind::LambdaExpr) {}
};

} // namespace exprguard::ast
