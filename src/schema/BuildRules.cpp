/***
 * Name: exprguard::schema::detail rule builders
 * Purpose: Validate configuration entries and convert them into typed rules.
 * Theory of Operation:
 *   Each builder checks one entry in isolation and throws SchemaError naming
 *   the operator, keyword or datafield at fault. Cross-entry checks
 *   (duplicate ids) belong to RuleSchema.
 */
#include "schema/detail/BuildRules.h"
#include "exprguard/exceptions/schema_error.h"
#include <cstdint>
#include <sstream>
#include <string>
#include <variant>

namespace exprguard::schema::detail {

namespace {
bool fitsType(const LiteralValue& value, const ValueType type) {
  switch (type) {
    case ValueType::Bool: return std::holds_alternative<bool>(value);
    case ValueType::Int: return std::holds_alternative<int64_t>(value);
    case ValueType::Float:
    case ValueType::Number:
      return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    case ValueType::Str: return std::holds_alternative<std::string>(value);
    case ValueType::Any: return true;
  }
  return false;
}

std::string where(const std::string& op, const std::string& kw) {
  return "operator '" + op + "' keyword '" + kw + "'";
}
} // namespace

KwargRule buildKwargRule(const std::string& op, const std::string& kw, const KwargConfig& cfg) {
  if (kw.empty()) {
    throw exceptions::SchemaError("operator '" + op + "': empty keyword name");
  }
  KwargRule rule;
  rule.name = kw;
  if (!parseValueType(cfg.type, rule.type)) {
    throw exceptions::SchemaError(where(op, kw) + ": unknown type '" + cfg.type + "'");
  }
  if ((cfg.minVal || cfg.maxVal) && !isNumeric(rule.type)) {
    throw exceptions::SchemaError(where(op, kw) + ": numeric bounds on non-numeric type '" + cfg.type + "'");
  }
  if (cfg.minVal && cfg.maxVal && *cfg.minVal > *cfg.maxVal) {
    std::ostringstream oss;
    oss << where(op, kw) << ": min_val " << *cfg.minVal << " exceeds max_val " << *cfg.maxVal;
    throw exceptions::SchemaError(oss.str());
  }
  if (cfg.allowed) {
    for (const auto& value : *cfg.allowed) {
      if (!fitsType(value, rule.type)) {
        throw exceptions::SchemaError(where(op, kw) + ": allowed value " + to_display(value) +
                                      " does not fit type '" + cfg.type + "'");
      }
    }
  }
  rule.allowed = cfg.allowed;
  rule.minVal = cfg.minVal;
  rule.maxVal = cfg.maxVal;
  rule.minInclusive = cfg.minInclusive.value_or(true);
  rule.maxInclusive = cfg.maxInclusive.value_or(true);
  return rule;
}

OperatorRule buildOperatorRule(const std::string& name, const OperatorConfig& cfg) {
  if (name.empty()) { throw exceptions::SchemaError("empty operator name"); }
  OperatorRule rule;
  rule.name = name;
  rule.minArgs = cfg.minArgs.value_or(0);
  rule.maxArgs = cfg.maxArgs.value_or(-1);
  if (rule.minArgs < 0) {
    throw exceptions::SchemaError("operator '" + name + "': negative min_args " + std::to_string(rule.minArgs));
  }
  if (rule.maxArgs < -1) {
    throw exceptions::SchemaError("operator '" + name + "': invalid max_args " + std::to_string(rule.maxArgs));
  }
  if (rule.maxArgs >= 0 && rule.maxArgs < rule.minArgs) {
    throw exceptions::SchemaError("operator '" + name + "': max_args " + std::to_string(rule.maxArgs) +
                                  " below min_args " + std::to_string(rule.minArgs));
  }
  for (const auto& [kw, kwCfg] : cfg.kwargs) {
    rule.kwargs.emplace(kw, buildKwargRule(name, kw, kwCfg));
  }
  return rule;
}

DatafieldDecl buildDatafieldDecl(const DatafieldConfig& cfg) {
  if (cfg.id.empty()) { throw exceptions::SchemaError("datafield with empty id"); }
  DatafieldDecl decl;
  decl.id = cfg.id;
  if (!parseDatafieldKind(cfg.type, decl.kind)) {
    throw exceptions::SchemaError("datafield '" + cfg.id + "': unknown kind '" + cfg.type + "'");
  }
  return decl;
}

} // namespace exprguard::schema::detail
