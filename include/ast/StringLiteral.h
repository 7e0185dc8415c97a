/***
 * Name: exprguard::ast::StringLiteral
 * Purpose: String literal node (quotes removed, escapes decoded).
 */
#pragma once

#include <string>
#include "ast/Literal.h"

namespace exprguard::ast {
    using StringLiteral = Literal<std::string, NodeKind::StringLiteral>;
}
