#pragma once

#include "Stmt.h"

namespace exprguard::ast {
    struct PassStmt final : Stmt {
        PassStmt() : Stmt(NodeKind::PassStmt) {}
    };
}
