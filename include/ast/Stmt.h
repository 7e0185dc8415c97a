/**
 * @file
 * @brief AST statement base declarations.
 */
#pragma once

#include "ast/Node.h"

namespace exprguard::ast {
    struct Stmt : Node {
        using Node::Node;
    };
}
