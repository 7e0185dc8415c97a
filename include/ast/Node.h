/**
 * @file
 * @brief AST base node declarations.
 */
#pragma once

#include "NodeKind.h"
#include <string>

namespace exprguard::ast {

    struct Node {
        NodeKind kind;
        explicit Node(const NodeKind k) : kind(k) {}
        virtual ~Node() = default;

        int line{0};
        int col{0};
        std::string file{};
    };

} // namespace exprguard::ast
