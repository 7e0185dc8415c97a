/**
 * @file
 * @brief Literal values carried by schema configuration (allowed sets).
 */
#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace exprguard::schema {

// monostate stands for None
using LiteralValue = std::variant<std::monostate, bool, int64_t, double, std::string>;

// Render a literal the way it would appear in an expression ("None", "True", "'x'", ...)
std::string to_display(const LiteralValue& value);

} // namespace exprguard::schema
