/***
 * Name: checkVectorScope
 * Purpose: VECTOR datafields may only appear inside vector-aware calls.
 * Theory of Operation:
 *   A use is in scope when it has at least one enclosing call and every
 *   enclosing call's operator starts with the vector prefix. One violation
 *   per offending use, naming the first enclosing call that breaks the rule.
 */
#include "validate/detail/Checks.h"
#include <string>

namespace exprguard::validate::detail {

void checkVectorScope(CheckContext& ctx) {
  const auto& ex = ctx.extraction;
  const auto& prefix = ctx.options.vectorPrefix;
  for (const auto& use : ex.datafieldUses) {
    const auto* decl = ctx.schema.lookupDatafield(use.name);
    if (decl == nullptr || decl->kind != schema::DatafieldKind::Vector) { continue; }
    const std::string head = "datafield '" + use.name + "' of type VECTOR ";
    if (use.enclosingCalls.empty()) {
      addViolation(ctx.out, Category::VectorScope, use.name,
                   head + "must be used inside a '" + prefix + "' operator", use.line, use.col);
      continue;
    }
    for (const auto index : use.enclosingCalls) {
      const auto& op = ex.callSites[index].op;
      if (op.compare(0, prefix.size(), prefix) == 0) { continue; }
      addViolation(ctx.out, Category::VectorScope, use.name,
                   head + "is passed to non-vector operator '" + op + "'", use.line, use.col, index);
      break;
    }
  }
}

} // namespace exprguard::validate::detail
