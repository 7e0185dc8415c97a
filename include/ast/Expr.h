/**
 * @file
 * @brief AST expression base declarations.
 */
#pragma once

#include "Node.h"

namespace exprguard::ast {
    struct Expr : Node {
        using Node::Node;
    };
} // namespace exprguard::ast
