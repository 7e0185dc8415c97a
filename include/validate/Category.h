/**
 * @file
 * @brief Violation categories, in the order the validator runs them.
 */
#pragma once

#include <array>

namespace exprguard::validate {

enum class Category {
    UnknownOperator,
    UnknownDatafield,
    Arity,
    UnknownKwarg,
    KwargType,
    KwargRange,
    KwargAllowed,
    VectorScope
};

inline constexpr std::array<Category, 8> kAllCategories{
    Category::UnknownOperator, Category::UnknownDatafield, Category::Arity,
    Category::UnknownKwarg,    Category::KwargType,        Category::KwargRange,
    Category::KwargAllowed,    Category::VectorScope};

// snake_case name used in reports ("unknown_operator", ...)
const char* to_string(Category category);

} // namespace exprguard::validate
