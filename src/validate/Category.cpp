/***
 * Name: exprguard::validate::to_string(Category)
 * Purpose: Report names for violation categories.
 */
#include "validate/Category.h"

namespace exprguard::validate {

const char* to_string(const Category category) {
  switch (category) {
    case Category::UnknownOperator: return "unknown_operator";
    case Category::UnknownDatafield: return "unknown_datafield";
    case Category::Arity: return "arity";
    case Category::UnknownKwarg: return "unknown_kwarg";
    case Category::KwargType: return "kwarg_type";
    case Category::KwargRange: return "kwarg_range";
    case Category::KwargAllowed: return "kwarg_allowed";
    case Category::VectorScope: return "vector_scope";
  }
  return "unknown_operator";
}

} // namespace exprguard::validate
