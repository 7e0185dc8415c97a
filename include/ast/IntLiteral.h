#pragma once

#include <cstdint>
#include "ast/Literal.h"

namespace exprguard::ast {

    using IntLiteral = Literal<int64_t, NodeKind::IntLiteral>;

} // namespace exprguard::ast
