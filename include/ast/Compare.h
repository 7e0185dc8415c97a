/**
 * @file
 * @brief AST declarations.
 */
#pragma once

#include <memory>
#include <utility>
#include <vector>
#include "Expr.h"
#include "ast/BinaryOperator.h"

namespace exprguard::ast {

// Chained comparison a < b <= c; single comparisons are Binary.
struct Compare final : Expr {
  std::unique_ptr<Expr> left;
  std::vector<BinaryOperator> ops;
  std::vector<std::unique_ptr<Expr>> comparators; // length equals ops.size()
  std::vector<std::pair<int, int>> opPositions;     // (line, col) of each operator token
  Compare() : Expr(NodeKind::Compare) {}
};

} // namespace exprguard::ast
