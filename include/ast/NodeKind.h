#pragma once

namespace exprguard::ast {
    enum class NodeKind {
        Module,
        AssignStmt,
        AugAssignStmt,
        ExprStmt,
        IfStmt,
        WhileStmt,
        ForStmt,
        ReturnStmt,
        PassStmt,
        IntLiteral,
        FloatLiteral,
        StringLiteral,
        BoolLiteral,
        NoneLiteral,
        FStringLiteral,
        Name,
        Call,
        BinaryExpr,
        Compare,
        UnaryExpr,
        Attribute,
        Subscript,
        LambdaExpr,
        IfExpr,
        NamedExpr,
        ListLiteral,
        TupleLiteral,
        DictLiteral,
        SetLiteral
    };

    inline const char *to_string(const NodeKind element) {
        switch (element) {
            case NodeKind::Module: return "Module";
            case NodeKind::AssignStmt: return "AssignStmt";
            case NodeKind::AugAssignStmt: return "AugAssignStmt";
            case NodeKind::ExprStmt: return "ExprStmt";
            case NodeKind::IfStmt: return "IfStmt";
            case NodeKind::WhileStmt: return "WhileStmt";
            case NodeKind::ForStmt: return "ForStmt";
            case NodeKind::ReturnStmt: return "ReturnStmt";
            case NodeKind::PassStmt: return "PassStmt";
            case NodeKind::IntLiteral: return "IntLiteral";
            case NodeKind::FloatLiteral: return "FloatLiteral";
            case NodeKind::StringLiteral: return "StringLiteral";
            case NodeKind::BoolLiteral: return "BoolLiteral";
            case NodeKind::NoneLiteral: return "NoneLiteral";
            case NodeKind::FStringLiteral: return "FStringLiteral";
            case NodeKind::Name: return "Name";
            case NodeKind::Call: return "Call";
            case NodeKind::BinaryExpr: return "BinaryExpr";
            case NodeKind::Compare: return "Compare";
            case NodeKind::UnaryExpr: return "UnaryExpr";
            case NodeKind::Attribute: return "Attribute";
            case NodeKind::Subscript: return "Subscript";
            case NodeKind::LambdaExpr: return "LambdaExpr";
            case NodeKind::IfExpr: return "IfExpr";
            case NodeKind::NamedExpr: return "NamedExpr";
            case NodeKind::ListLiteral: return "ListLiteral";
            case NodeKind::TupleLiteral: return "TupleLiteral";
            case NodeKind::DictLiteral: return "DictLiteral";
            case NodeKind::SetLiteral: return "SetLiteral";
        }
        return "unknown";
    }
} // namespace exprguard::ast
