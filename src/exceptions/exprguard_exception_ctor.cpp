/***
 * Name: exprguard::exceptions::ExprguardException::ExprguardException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include <utility>

#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard {
namespace exceptions {

ExprguardException::ExprguardException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace exprguard
