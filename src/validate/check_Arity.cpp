/***
 * Name: checkArity
 * Purpose: Positional argument counts, series lookback literals and boolean
 *   operand counts against the operator rules.
 * Theory of Operation:
 *   For a call whose operator carries the series prefix, a literal given for
 *   a required positional (index < min_args) is a lookback window and must
 *   be an int. Names and calls are not checked. An 'and'/'or' chain counts
 *   its operands like a call counts positionals. The violations of this
 *   category are ordered by position.
 */
#include "validate/detail/Checks.h"
#include "validate/detail/Literals.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace exprguard::validate::detail {

namespace {
std::string expectedText(const schema::OperatorRule& rule) {
  if (rule.unbounded()) { return "at least " + std::to_string(rule.minArgs); }
  if (rule.minArgs == rule.maxArgs) { return "exactly " + std::to_string(rule.minArgs); }
  return "between " + std::to_string(rule.minArgs) + " and " + std::to_string(rule.maxArgs);
}

bool countFits(const schema::OperatorRule& rule, const long long count) {
  return count >= rule.minArgs && (rule.unbounded() || count <= rule.maxArgs);
}

void checkLookbackLiterals(CheckContext& ctx, const extract::CallSite& site, const schema::OperatorRule& rule) {
  const auto& prefix = ctx.options.seriesPrefix;
  if (prefix.empty() || site.op.compare(0, prefix.size(), prefix) != 0) { return; }
  const auto required = std::min(site.positional.size(), static_cast<size_t>(rule.minArgs));
  for (size_t i = 0; i < required; ++i) {
    const auto* arg = site.positional[i];
    const auto value = literalOf(*arg);
    if (!value || std::holds_alternative<int64_t>(*value)) { continue; }
    addViolation(ctx.out, Category::Arity, site.op,
                 "'" + site.op + "' expects an int lookback for positional argument " + std::to_string(i + 1) +
                     ", got " + literalKind(*value) + " " + schema::to_display(*value),
                 arg->line, arg->col, site.index);
  }
}
} // namespace

void checkArity(CheckContext& ctx) {
  const auto first = static_cast<std::ptrdiff_t>(ctx.out.size());
  for (const auto& site : ctx.extraction.callSites) {
    const auto* rule = ctx.schema.lookupOperator(site.op);
    if (rule == nullptr) { continue; }
    const auto count = static_cast<long long>(site.positional.size());
    if (!countFits(*rule, count)) {
      addViolation(ctx.out, Category::Arity, site.op,
                   "'" + site.op + "' expects " + expectedText(*rule) + " positional argument(s), got " +
                       std::to_string(count),
                   site.line, site.col, site.index);
    }
    checkLookbackLiterals(ctx, site, *rule);
  }
  for (const auto& use : ctx.extraction.operatorUses) {
    if (!use.operandCount) { continue; }
    const auto* rule = ctx.schema.lookupOperator(use.op);
    if (rule == nullptr) { continue; }
    const auto count = static_cast<long long>(*use.operandCount);
    if (countFits(*rule, count)) { continue; }
    addViolation(ctx.out, Category::Arity, use.op,
                 "'" + use.op + "' expects " + expectedText(*rule) + " operand(s), got " + std::to_string(count),
                 use.line, use.col);
  }
  std::stable_sort(ctx.out.begin() + first, ctx.out.end(), [](const Violation& a, const Violation& b) {
    return a.line != b.line ? a.line < b.line : a.col < b.col;
  });
}

} // namespace exprguard::validate::detail
