#pragma once

#include "ast/Expr.h"

namespace exprguard::ast {

template <typename T, NodeKind K>
struct Literal final : Expr {
    T value;
    explicit Literal(const T v) : Expr(K), value(v) {}
};

} // namespace exprguard::ast
