#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace exprguard::ast {

struct TupleLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements;
  TupleLiteral() : Expr(NodeKind::TupleLiteral) {}
};

} // namespace exprguard::ast
