#pragma once

#include "ast/Literal.h"

namespace exprguard::ast {

    using BoolLiteral = Literal<bool, NodeKind::BoolLiteral>;

} // namespace exprguard::ast
