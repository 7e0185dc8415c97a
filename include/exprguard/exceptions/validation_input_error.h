/***
 * Name: exprguard::exceptions::ValidationInputError
 * Purpose: Exception for a validation request with a malformed extraction.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ExprguardException.
 */
#pragma once

#include <string>
#include <utility>

#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard {
namespace exceptions {

class ValidationInputError : public ExprguardException {
 public:
  explicit ValidationInputError(std::string msg) noexcept : ExprguardException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace exprguard
