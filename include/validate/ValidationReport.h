/***
 * Name: exprguard::validate::ValidationReport
 * Purpose: Ordered violations produced by one validation.
 * Theory of Operation:
 *   A plain value. Violations are stored in the order the checks produced
 *   them (by category, then by first appearance). Rendering is done on
 *   demand and is deterministic for equal reports.
 */
#pragma once

#include "validate/Category.h"
#include "validate/Violation.h"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace exprguard::validate {

class ValidationReport {
 public:
  ValidationReport() = default;
  explicit ValidationReport(std::vector<Violation> violations) : violations_(std::move(violations)) {}

  bool ok() const { return violations_.empty(); }
  size_t size() const { return violations_.size(); }
  const std::vector<Violation>& violations() const { return violations_; }
  size_t count(Category category) const;

  // One message() per line; "ok\n" when empty
  std::string toText() const;
  std::string toJson() const;

 private:
  std::vector<Violation> violations_{};
};

} // namespace exprguard::validate
