#pragma once
#include <memory>
#include <string>
#include <vector>

#include "Expr.h"

namespace exprguard::ast {
    struct KeywordArg {
        std::string name;
        std::unique_ptr<Expr> value;
        int line{0};
        int col{0};
    };

    struct Call final : Expr {
        std::unique_ptr<Expr> callee; // typically Name
        std::vector<std::unique_ptr<Expr>> args;      // positional
        std::vector<KeywordArg> keywords;             // named args, unique names
        std::vector<std::unique_ptr<Expr>> starArgs;  // *expr
        std::vector<std::unique_ptr<Expr>> kwStarArgs;// **expr
        explicit Call(std::unique_ptr<Expr> c) : Expr(NodeKind::Call), callee(std::move(c)) {}
    };

} // namespace exprguard::ast
