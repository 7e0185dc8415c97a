/***
 * Name: exprguard::exceptions::SchemaError
 * Purpose: Exception for malformed operator or datafield configuration.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from ExprguardException; thrown only
 *   while a RuleSchema is being constructed.
 */
#pragma once

#include <string>
#include <utility>

#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard {
namespace exceptions {

class SchemaError : public ExprguardException {
 public:
  explicit SchemaError(std::string msg) noexcept : ExprguardException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace exprguard
