/***
 * Name: checkUnknownKwarg
 * Purpose: Keywords not declared by the called operator's rule.
 */
#include "validate/detail/Checks.h"
#include <string>

namespace exprguard::validate::detail {

void checkUnknownKwarg(CheckContext& ctx) {
  for (const auto& site : ctx.extraction.callSites) {
    const auto* rule = ctx.schema.lookupOperator(site.op);
    if (rule == nullptr) { continue; }
    for (const auto& kw : site.keywords) {
      if (rule->findKwarg(kw.name) != nullptr) { continue; }
      addViolation(ctx.out, Category::UnknownKwarg, site.op,
                   "invalid keyword argument '" + kw.name + "' for '" + site.op + "'",
                   kw.line, kw.col, site.index, kw.name);
    }
  }
}

} // namespace exprguard::validate::detail
