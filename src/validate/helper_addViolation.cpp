/***
 * Name: addViolation
 * Purpose: Append a violation with its source location to the vector.
 */
#include "validate/detail/CheckContext.h"
#include <utility>

namespace exprguard::validate::detail {

void addViolation(std::vector<Violation>& out, const Category category, const std::string& subject,
                  const std::string& detail, const int line, const int col,
                  const std::optional<size_t> callIndex, const std::string& keyword) {
  Violation v;
  v.category = category;
  v.subject = subject;
  v.callIndex = callIndex;
  v.keyword = keyword;
  v.detail = detail;
  v.line = line;
  v.col = col;
  out.push_back(std::move(v));
}

} // namespace exprguard::validate::detail
