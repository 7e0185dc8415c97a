/***
 * Name: exprguard::ast::forEachChild
 * Purpose: Enumerate the direct children of a node in source order.
 * Inputs:
 *   - node: any AST node
 *   - fn: callable taking (const Node&)
 * Theory of Operation:
 *   Generic traversals (printing, geometry) use this instead of writing a
 *   visit overload per node type. Null optional children are skipped.
 */
#pragma once

#include <memory>
#include <vector>
#include "ast/Nodes.h"

namespace exprguard::ast {

namespace detail {
template <typename T, typename F>
void eachOf(const std::vector<std::unique_ptr<T>>& items, F& fn) {
    for (const auto& item : items) {
        if (item) { fn(static_cast<const Node&>(*item)); }
    }
}

template <typename T, typename F>
void one(const std::unique_ptr<T>& item, F& fn) {
    if (item) { fn(static_cast<const Node&>(*item)); }
}
} // namespace detail

template <typename F>
void forEachChild(const Node& n, F&& fn) {
    switch (n.kind) {
        case NodeKind::Module:
            detail::eachOf(static_cast<const Module&>(n).body, fn);
            break;
        case NodeKind::AssignStmt: {
            const auto& s = static_cast<const AssignStmt&>(n);
            detail::eachOf(s.targets, fn);
            detail::one(s.value, fn);
            break;
        }
        case NodeKind::AugAssignStmt: {
            const auto& s = static_cast<const AugAssignStmt&>(n);
            detail::one(s.target, fn);
            detail::one(s.value, fn);
            break;
        }
        case NodeKind::ExprStmt:
            detail::one(static_cast<const ExprStmt&>(n).value, fn);
            break;
        case NodeKind::IfStmt: {
            const auto& s = static_cast<const IfStmt&>(n);
            detail::one(s.cond, fn);
            detail::eachOf(s.thenBody, fn);
            detail::eachOf(s.elseBody, fn);
            break;
        }
        case NodeKind::WhileStmt: {
            const auto& s = static_cast<const WhileStmt&>(n);
            detail::one(s.cond, fn);
            detail::eachOf(s.thenBody, fn);
            detail::eachOf(s.elseBody, fn);
            break;
        }
        case NodeKind::ForStmt: {
            const auto& s = static_cast<const ForStmt&>(n);
            detail::one(s.target, fn);
            detail::one(s.iterable, fn);
            detail::eachOf(s.thenBody, fn);
            detail::eachOf(s.elseBody, fn);
            break;
        }
        case NodeKind::ReturnStmt:
            detail::one(static_cast<const ReturnStmt&>(n).value, fn);
            break;
        case NodeKind::PassStmt:
        case NodeKind::IntLiteral:
        case NodeKind::FloatLiteral:
        case NodeKind::StringLiteral:
        case NodeKind::BoolLiteral:
        case NodeKind::NoneLiteral:
        case NodeKind::FStringLiteral:
        case NodeKind::Name:
            break;
        case NodeKind::Call: {
            const auto& c = static_cast<const Call&>(n);
            detail::one(c.callee, fn);
            detail::eachOf(c.args, fn);
            for (const auto& kw : c.keywords) { detail::one(kw.value, fn); }
            detail::eachOf(c.starArgs, fn);
            detail::eachOf(c.kwStarArgs, fn);
            break;
        }
        case NodeKind::BinaryExpr: {
            const auto& b = static_cast<const Binary&>(n);
            detail::one(b.lhs, fn);
            detail::one(b.rhs, fn);
            break;
        }
        case NodeKind::Compare: {
            const auto& c = static_cast<const Compare&>(n);
            detail::one(c.left, fn);
            detail::eachOf(c.comparators, fn);
            break;
        }
        case NodeKind::UnaryExpr:
            detail::one(static_cast<const Unary&>(n).operand, fn);
            break;
        case NodeKind::Attribute:
            detail::one(static_cast<const Attribute&>(n).value, fn);
            break;
        case NodeKind::Subscript: {
            const auto& s = static_cast<const Subscript&>(n);
            detail::one(s.value, fn);
            detail::one(s.slice, fn);
            break;
        }
        case NodeKind::LambdaExpr:
            detail::one(static_cast<const LambdaExpr&>(n).body, fn);
            break;
        case NodeKind::IfExpr: {
            const auto& e = static_cast<const IfExpr&>(n);
            detail::one(e.body, fn);
            detail::one(e.test, fn);
            detail::one(e.orelse, fn);
            break;
        }
        case NodeKind::NamedExpr:
            detail::one(static_cast<const NamedExpr&>(n).value, fn);
            break;
        case NodeKind::ListLiteral:
            detail::eachOf(static_cast<const ListLiteral&>(n).elements, fn);
            break;
        case NodeKind::TupleLiteral:
            detail::eachOf(static_cast<const TupleLiteral&>(n).elements, fn);
            break;
        case NodeKind::SetLiteral:
            detail::eachOf(static_cast<const SetLiteral&>(n).elements, fn);
            break;
        case NodeKind::DictLiteral:
            for (const auto& kv : static_cast<const DictLiteral&>(n).items) {
                detail::one(kv.first, fn);
                detail::one(kv.second, fn);
            }
            break;
    }
}

} // namespace exprguard::ast
