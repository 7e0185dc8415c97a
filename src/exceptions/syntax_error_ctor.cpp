/***
 * Name: exprguard::exceptions::SyntaxError::SyntaxError
 * Purpose: Construct a syntax error with its primary source position.
 */
#include <utility>

#include "exprguard/exceptions/syntax_error.h"

namespace exprguard::exceptions {

SyntaxError::SyntaxError(std::string msg, const int line, const int col) noexcept
    : ExprguardException(std::move(msg)), line_(line), col_(col) {}

}  // namespace exprguard::exceptions
