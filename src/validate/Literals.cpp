/***
 * Name: exprguard::validate::detail literal helpers (impl)
 */
#include "validate/detail/Literals.h"
#include "ast/Nodes.h"
#include <cmath>
#include <cstdint>
#include <sstream>
#include <string>
#include <variant>

namespace exprguard::validate::detail {

std::optional<schema::LiteralValue> literalOf(const ast::Expr& e) {
  switch (e.kind) {
    case ast::NodeKind::IntLiteral: return schema::LiteralValue{static_cast<const ast::IntLiteral&>(e).value};
    case ast::NodeKind::FloatLiteral: return schema::LiteralValue{static_cast<const ast::FloatLiteral&>(e).value};
    case ast::NodeKind::BoolLiteral: return schema::LiteralValue{static_cast<const ast::BoolLiteral&>(e).value};
    case ast::NodeKind::StringLiteral: return schema::LiteralValue{static_cast<const ast::StringLiteral&>(e).value};
    case ast::NodeKind::NoneLiteral: return schema::LiteralValue{std::monostate{}};
    default: return std::nullopt;
  }
}

const char* literalKind(const schema::LiteralValue& value) {
  if (std::holds_alternative<bool>(value)) { return "bool"; }
  if (std::holds_alternative<int64_t>(value)) { return "int"; }
  if (std::holds_alternative<double>(value)) { return "float"; }
  if (std::holds_alternative<std::string>(value)) { return "str"; }
  return "None";
}

std::string describeExpr(const ast::Expr& e) {
  switch (e.kind) {
    case ast::NodeKind::Name: return "name '" + static_cast<const ast::Name&>(e).id + "'";
    case ast::NodeKind::Call: {
      const auto& call = static_cast<const ast::Call&>(e);
      if (call.callee && call.callee->kind == ast::NodeKind::Name) {
        return "call to '" + static_cast<const ast::Name&>(*call.callee).id + "'";
      }
      return "call";
    }
    default: return "expression";
  }
}

std::string formatBound(const double value) {
  constexpr double kMaxExact = 9007199254740992.0; // 2^53
  if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < kMaxExact) {
    return std::to_string(static_cast<int64_t>(value));
  }
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

} // namespace exprguard::validate::detail
