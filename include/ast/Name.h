/**
 * @file
 * @brief AST name node declarations.
 */
#pragma once
#include <string>
#include "Expr.h"

namespace exprguard::ast {

    struct Name final : Expr {
        std::string id;
        explicit Name(std::string s) : Expr(NodeKind::Name), id(std::move(s)) {}
    };

} // namespace exprguard::ast
