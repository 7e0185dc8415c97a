/***
 * Name: checkKwargRange
 * Purpose: Numeric keyword literals must lie within the declared bounds.
 * Theory of Operation:
 *   Bounds are inclusive unless the rule marks them exclusive. Only int and
 *   float literals are range checked; other kinds are left to the type check.
 */
#include "validate/detail/Checks.h"
#include "validate/detail/Literals.h"
#include <cstdint>
#include <string>
#include <variant>

namespace exprguard::validate::detail {

namespace {
std::string rangeText(const schema::KwargRule& r) {
  std::string s = r.minVal ? (r.minInclusive ? "[" : "(") + formatBound(*r.minVal) : std::string("(-inf");
  s += ", ";
  s += r.maxVal ? formatBound(*r.maxVal) + (r.maxInclusive ? "]" : ")") : std::string("inf)");
  return s;
}
} // namespace

void checkKwargRange(CheckContext& ctx) {
  for (const auto& site : ctx.extraction.callSites) {
    const auto* rule = ctx.schema.lookupOperator(site.op);
    if (rule == nullptr) { continue; }
    for (const auto& kw : site.keywords) {
      const auto* kwRule = rule->findKwarg(kw.name);
      if (kwRule == nullptr || kw.value == nullptr || (!kwRule->minVal && !kwRule->maxVal)) { continue; }
      const auto value = literalOf(*kw.value);
      if (!value) { continue; }
      double x = 0.0;
      if (const auto* i = std::get_if<int64_t>(&*value)) {
        x = static_cast<double>(*i);
      } else if (const auto* d = std::get_if<double>(&*value)) {
        x = *d;
      } else {
        continue;
      }
      const bool belowMin = kwRule->minVal && (kwRule->minInclusive ? x < *kwRule->minVal : x <= *kwRule->minVal);
      const bool aboveMax = kwRule->maxVal && (kwRule->maxInclusive ? x > *kwRule->maxVal : x >= *kwRule->maxVal);
      if (!belowMin && !aboveMax) { continue; }
      addViolation(ctx.out, Category::KwargRange, site.op,
                   "keyword '" + kw.name + "' of '" + site.op + "' must be in " + rangeText(*kwRule) +
                       ", got " + schema::to_display(*value),
                   kw.line, kw.col, site.index, kw.name);
    }
  }
}

} // namespace exprguard::validate::detail
