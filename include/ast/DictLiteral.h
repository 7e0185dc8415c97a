/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "Expr.h"

namespace exprguard::ast {

struct DictLiteral final : Expr {
  // key:value pairs
  std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Expr>>> items;
  DictLiteral() : Expr(NodeKind::DictLiteral) {}
};

} // namespace exprguard::ast
