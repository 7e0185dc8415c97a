/***
 * Name: checkKwargAllowed
 * Purpose: Keyword literals must be members of a declared allowed set.
 * Theory of Operation:
 *   int and float compare numerically (3 matches 3.0); bool, str and None
 *   only match values of their own kind.
 */
#include "validate/detail/Checks.h"
#include "validate/detail/Literals.h"
#include <cstdint>
#include <string>
#include <variant>

namespace exprguard::validate::detail {

namespace {
bool asNumber(const schema::LiteralValue& v, double& out) {
  if (const auto* i = std::get_if<int64_t>(&v)) { out = static_cast<double>(*i); return true; }
  if (const auto* d = std::get_if<double>(&v)) { out = *d; return true; }
  return false;
}

bool sameLiteral(const schema::LiteralValue& a, const schema::LiteralValue& b) {
  double x = 0.0;
  double y = 0.0;
  if (asNumber(a, x) && asNumber(b, y)) { return x == y; }
  return a == b;
}

std::string setText(const std::vector<schema::LiteralValue>& values) {
  std::string s = "[";
  for (size_t i = 0; i < values.size(); ++i) {
    if (i != 0) { s += ", "; }
    s += schema::to_display(values[i]);
  }
  return s + "]";
}
} // namespace

void checkKwargAllowed(CheckContext& ctx) {
  for (const auto& site : ctx.extraction.callSites) {
    const auto* rule = ctx.schema.lookupOperator(site.op);
    if (rule == nullptr) { continue; }
    for (const auto& kw : site.keywords) {
      const auto* kwRule = rule->findKwarg(kw.name);
      if (kwRule == nullptr || kw.value == nullptr || !kwRule->allowed) { continue; }
      const auto value = literalOf(*kw.value);
      if (!value) { continue; }
      bool found = false;
      for (const auto& candidate : *kwRule->allowed) {
        if (sameLiteral(*value, candidate)) { found = true; break; }
      }
      if (found) { continue; }
      addViolation(ctx.out, Category::KwargAllowed, site.op,
                   "keyword '" + kw.name + "' of '" + site.op + "' got " + schema::to_display(*value) +
                       ", expected one of " + setText(*kwRule->allowed),
                   kw.line, kw.col, site.index, kw.name);
    }
  }
}

} // namespace exprguard::validate::detail
