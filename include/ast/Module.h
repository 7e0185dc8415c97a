/**
 * @file
 * @brief AST module node declarations.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Node.h"
#include "ast/Stmt.h"

namespace exprguard::ast {
    // Top-level statements of one expression text, in source order.
    struct Module final : Node {
        std::vector<std::unique_ptr<Stmt>> body;
        Module() : Node(NodeKind::Module) {}
    };
} // namespace exprguard::ast
