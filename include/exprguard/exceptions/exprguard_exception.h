/***
 * Name: exprguard::exceptions::ExprguardException
 * Purpose: Base class for all exprguard exceptions; do not throw built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but every throw in exprguard uses a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace exprguard {
namespace exceptions {

class ExprguardException : public std::exception {
 public:
  virtual ~ExprguardException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit ExprguardException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace exprguard
