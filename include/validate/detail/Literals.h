/***
 * Name: exprguard::validate::detail literal helpers
 * Purpose: Read a keyword argument expression as a schema literal.
 * Theory of Operation:
 *   Only literal nodes produce a value; negative numbers are already folded
 *   into literals by the parser. Anything else (names, calls, arithmetic)
 *   cannot be checked statically and yields nullopt.
 */
#pragma once

#include "ast/Expr.h"
#include "schema/LiteralValue.h"
#include <optional>
#include <string>

namespace exprguard::validate::detail {

std::optional<schema::LiteralValue> literalOf(const ast::Expr& e);

// "bool" | "int" | "float" | "str" | "None"
const char* literalKind(const schema::LiteralValue& value);

// Short description of a non-literal argument ("name 'x'", "call to 'f'", ...)
std::string describeExpr(const ast::Expr& e);

// Print whole bounds without a fraction ("1", "0.25")
std::string formatBound(double value);

} // namespace exprguard::validate::detail
