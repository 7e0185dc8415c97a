/***
 * Name: exprguard::ast::dispatch
 * Purpose: Central switch from NodeKind to the concrete node type.
 * Theory of Operation:
 *   The switch names every NodeKind and has no default, so a visitor that
 *   misses a node type fails to compile and a new kind trips -Wswitch.
 */
#pragma once

#include "ast/Nodes.h"

namespace exprguard::ast {

template <typename V>
void dispatch(const Node& n, V& v) {
    switch (n.kind) {
        case NodeKind::Module: v.visit(static_cast<const Module&>(n)); break;
        case NodeKind::AssignStmt: v.visit(static_cast<const AssignStmt&>(n)); break;
        case NodeKind::AugAssignStmt: v.visit(static_cast<const AugAssignStmt&>(n)); break;
        case NodeKind::ExprStmt: v.visit(static_cast<const ExprStmt&>(n)); break;
        case NodeKind::IfStmt: v.visit(static_cast<const IfStmt&>(n)); break;
        case NodeKind::WhileStmt: v.visit(static_cast<const WhileStmt&>(n)); break;
        case NodeKind::ForStmt: v.visit(static_cast<const ForStmt&>(n)); break;
        case NodeKind::ReturnStmt: v.visit(static_cast<const ReturnStmt&>(n)); break;
        case NodeKind::PassStmt: v.visit(static_cast<const PassStmt&>(n)); break;
        case NodeKind::IntLiteral: v.visit(static_cast<const IntLiteral&>(n)); break;
        case NodeKind::FloatLiteral: v.visit(static_cast<const FloatLiteral&>(n)); break;
        case NodeKind::StringLiteral: v.visit(static_cast<const StringLiteral&>(n)); break;
        case NodeKind::BoolLiteral: v.visit(static_cast<const BoolLiteral&>(n)); break;
        case NodeKind::NoneLiteral: v.visit(static_cast<const NoneLiteral&>(n)); break;
        case NodeKind::FStringLiteral: v.visit(static_cast<const FStringLiteral&>(n)); break;
        case NodeKind::Name: v.visit(static_cast<const Name&>(n)); break;
        case NodeKind::Call: v.visit(static_cast<const Call&>(n)); break;
        case NodeKind::BinaryExpr: v.visit(static_cast<const Binary&>(n)); break;
        case NodeKind::Compare: v.visit(static_cast<const Compare&>(n)); break;
        case NodeKind::UnaryExpr: v.visit(static_cast<const Unary&>(n)); break;
        case NodeKind::Attribute: v.visit(static_cast<const Attribute&>(n)); break;
        case NodeKind::Subscript: v.visit(static_cast<const Subscript&>(n)); break;
        case NodeKind::LambdaExpr: v.visit(static_cast<const LambdaExpr&>(n)); break;
        case NodeKind::IfExpr: v.visit(static_cast<const IfExpr&>(n)); break;
        case NodeKind::NamedExpr: v.visit(static_cast<const NamedExpr&>(n)); break;
        case NodeKind::ListLiteral: v.visit(static_cast<const ListLiteral&>(n)); break;
        case NodeKind::TupleLiteral: v.visit(static_cast<const TupleLiteral&>(n)); break;
        case NodeKind::DictLiteral: v.visit(static_cast<const DictLiteral&>(n)); break;
        case NodeKind::SetLiteral: v.visit(static_cast<const SetLiteral&>(n)); break;
    }
}

} // namespace exprguard::ast
