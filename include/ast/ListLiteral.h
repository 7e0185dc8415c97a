#pragma once

#include <memory>
#include <vector>
#include "ast/Expr.h"

namespace exprguard::ast {

struct ListLiteral final : Expr {
  std::vector<std::unique_ptr<Expr>> elements;
  ListLiteral() : Expr(NodeKind::ListLiteral) {}
};

} // namespace exprguard::ast
