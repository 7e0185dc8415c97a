/***
 * Name: exprguard::exceptions::ExprguardException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard::exceptions {

const char* ExprguardException::what() const noexcept { return message_.c_str(); }

}  // namespace exprguard::exceptions
