/***
 * Name: exprguard::exceptions::UnsupportedConstruct
 * Purpose: Exception for a syntactically valid construct outside the formula grammar.
 * Inputs: Construct name (e.g. "subscript"), message, and source position
 * Outputs: Exception object
 * Theory of Operation: Raised instead of skipping the node so that unvetted
 *   constructs never reach validation.
 */
#pragma once

#include <string>

#include "exprguard/exceptions/exprguard_exception.h"

namespace exprguard {
namespace exceptions {

class UnsupportedConstruct : public ExprguardException {
 public:
  UnsupportedConstruct(std::string construct, std::string msg, int line, int col) noexcept;

  const std::string& construct() const noexcept { return construct_; }
  int line() const noexcept { return line_; }
  int col() const noexcept { return col_; }

 private:
  std::string construct_;
  int line_{0};
  int col_{0};
};

}  // namespace exceptions
}  // namespace exprguard
