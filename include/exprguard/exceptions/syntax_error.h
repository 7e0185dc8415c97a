/***
 * Name: exprguard::exceptions::SyntaxError
 * Purpose: Exception for expression text the front end cannot tokenize or parse.
 * Inputs: Error message (already carrying file:line:col context) and position
 * Outputs: Exception object
 * Theory of Operation: Fatal for one extraction; the caller must not validate a partial result.
 */
#pragma once

#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard {
namespace exceptions {

class SyntaxError : public ExprguardException {
 public:
  SyntaxError(std::string msg, int line, int col) noexcept;

  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace exprguard
