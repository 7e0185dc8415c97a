/***
 * Name: exprguard::validate::Violation
 * Purpose: One rule failure found in an expression.
 * Inputs:
 *   - category, subject (operator or datafield name), optional call index,
 *     keyword (for keyword categories), detail text, source position.
 * Outputs:
 *   - message(): "line:col: category: detail"
 */
#pragma once

#include "validate/Category.h"
#include <cstddef>
#include <optional>
#include <string>

namespace exprguard::validate {

struct Violation {
    Category category{Category::UnknownOperator};
    std::string subject;
    std::optional<size_t> callIndex;
    std::string keyword; // empty unless a keyword category
    std::string detail;
    int line{0};
    int col{0};

    std::string message() const;
};

} // namespace exprguard::validate
