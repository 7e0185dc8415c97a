#pragma once

#include "ast/Literal.h"

namespace exprguard::ast {

    using FloatLiteral = Literal<double, NodeKind::FloatLiteral>;

} // namespace exprguard::ast
