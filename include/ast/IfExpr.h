#pragma once

#include <memory>
#include "ast/Expr.h"

namespace exprguard::ast {

struct IfExpr final : Expr {
  std::unique_ptr<Expr> test;
  std::unique_ptr<Expr> body;
  std::unique_ptr<Expr> orelse;
  IfExpr(std::unique_ptr<Expr> b, std::unique_ptr<Expr> t, std::unique_ptr<Expr> e)
      : Expr(NodeKind::IfExpr), test(std::move(t)), body(std::move(b)), orelse(std::move(e)) {}
};

} // namespace exprguard::ast
