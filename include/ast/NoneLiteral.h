/***
 * Name: exprguard::ast::NoneLiteral
 * Purpose: Represent the None literal.
 */
#pragma once

#include "ast/Expr.h"

namespace exprguard::ast {

struct NoneLiteral final : Expr {
  NoneLiteral() : Expr(NodeKind::NoneLiteral) {}
};

}
