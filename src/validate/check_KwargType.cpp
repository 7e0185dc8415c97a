/***
 * Name: checkKwargType
 * Purpose: Declared keywords must carry a literal of the declared type.
 * Theory of Operation:
 *   A non-literal value cannot be checked statically and is a violation.
 *   bool never satisfies a numeric type. An int literal satisfies float
 *   when ValidatorOptions::widenIntToFloat is set.
 */
#include "validate/detail/Checks.h"
#include "validate/detail/Literals.h"
#include <cstdint>
#include <string>
#include <variant>

namespace exprguard::validate::detail {

namespace {
bool matches(const schema::LiteralValue& value, const schema::ValueType type, const bool widen) {
  switch (type) {
    case schema::ValueType::Bool: return std::holds_alternative<bool>(value);
    case schema::ValueType::Int: return std::holds_alternative<int64_t>(value);
    case schema::ValueType::Float:
      return std::holds_alternative<double>(value) || (widen && std::holds_alternative<int64_t>(value));
    case schema::ValueType::Number:
      return std::holds_alternative<double>(value) || std::holds_alternative<int64_t>(value);
    case schema::ValueType::Str: return std::holds_alternative<std::string>(value);
    case schema::ValueType::Any: return true;
  }
  return false;
}
} // namespace

void checkKwargType(CheckContext& ctx) {
  for (const auto& site : ctx.extraction.callSites) {
    const auto* rule = ctx.schema.lookupOperator(site.op);
    if (rule == nullptr) { continue; }
    for (const auto& kw : site.keywords) {
      const auto* kwRule = rule->findKwarg(kw.name);
      if (kwRule == nullptr || kw.value == nullptr) { continue; }
      const std::string head = "keyword '" + kw.name + "' of '" + site.op + "' expects ";
      const auto value = literalOf(*kw.value);
      if (!value) {
        addViolation(ctx.out, Category::KwargType, site.op,
                     head + "a literal " + schema::to_string(kwRule->type) + ", got " + describeExpr(*kw.value),
                     kw.line, kw.col, site.index, kw.name);
        continue;
      }
      if (matches(*value, kwRule->type, ctx.options.widenIntToFloat)) { continue; }
      addViolation(ctx.out, Category::KwargType, site.op,
                   head + schema::to_string(kwRule->type) + ", got " + literalKind(*value) + " " +
                       schema::to_display(*value),
                   kw.line, kw.col, site.index, kw.name);
    }
  }
}

} // namespace exprguard::validate::detail
