/***
 * Name: checkDatafieldMembership
 * Purpose: One unknown_datafield per distinct free name with no declaration.
 */
#include "validate/detail/Checks.h"
#include <string>

namespace exprguard::validate::detail {

void checkDatafieldMembership(CheckContext& ctx) {
  const auto& ex = ctx.extraction;
  for (const auto& name : ex.datafields) {
    if (ctx.schema.lookupDatafield(name) != nullptr) { continue; }
    int line = 0;
    int col = 0;
    for (const auto& use : ex.datafieldUses) {
      if (use.name == name) { line = use.line; col = use.col; break; }
    }
    addViolation(ctx.out, Category::UnknownDatafield, name,
                 "datafield or variable '" + name + "' is not defined or allowed", line, col);
  }
}

} // namespace exprguard::validate::detail
