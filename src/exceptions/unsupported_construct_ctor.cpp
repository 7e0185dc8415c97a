/***
 * Name: exprguard::exceptions::UnsupportedConstruct::UnsupportedConstruct
 * Purpose: Construct an unsupported-construct error naming the offending node.
 */
#include <utility>

#include "exprguard/exceptions/unsupported_construct.h"

namespace exprguard::exceptions {

UnsupportedConstruct::UnsupportedConstruct(std::string construct, std::string msg,
                                           const int line, const int col) noexcept
    : ExprguardException(std::move(msg)), construct_(std::move(construct)), line_(line), col_(col) {}

}  // namespace exprguard::exceptions
