/***
 * Name: exprguard::ast::FStringLiteral
 * Purpose: Formatted string literal kept as raw text; never interpreted.
 */
#pragma once

#include <string>
#include "ast/Expr.h"

namespace exprguard::ast {

struct FStringLiteral final : Expr {
  std::string raw; // body between the quotes
  explicit FStringLiteral(std::string r) : Expr(NodeKind::FStringLiteral), raw(std::move(r)) {}
};

} // namespace exprguard::ast
