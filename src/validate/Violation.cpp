/***
 * Name: exprguard::validate::Violation::message
 * Purpose: Human-readable one-line rendering.
 */
#include "validate/Violation.h"
#include <sstream>
#include <string>

namespace exprguard::validate {

std::string Violation::message() const {
  std::ostringstream oss;
  oss << line << ":" << col << ": " << to_string(category) << ": " << detail;
  return oss.str();
}

} // namespace exprguard::validate
