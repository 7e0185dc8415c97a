/***
 * Name: checkOperatorMembership
 * Purpose: One unknown_operator per distinct operator missing from the schema,
 *   positioned at its first use.
 */
#include "validate/detail/Checks.h"
#include <string>

namespace exprguard::validate::detail {

void checkOperatorMembership(CheckContext& ctx) {
  const auto& ex = ctx.extraction;
  for (const auto& op : ex.operators) {
    if (ctx.schema.lookupOperator(op) != nullptr) { continue; }
    int line = 0;
    int col = 0;
    std::optional<size_t> callIndex;
    for (const auto& use : ex.operatorUses) {
      if (use.op == op) { line = use.line; col = use.col; callIndex = use.callIndex; break; }
    }
    addViolation(ctx.out, Category::UnknownOperator, op,
                 "operator '" + op + "' is not defined or allowed", line, col, callIndex);
  }
}

} // namespace exprguard::validate::detail
