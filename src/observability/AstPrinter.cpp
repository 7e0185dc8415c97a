/***
 * Name: exprguard::obs::AstPrinter (impl)
 */
#include "observability/AstPrinter.h"
#include "ast/Children.h"
#include <sstream>
#include <string>

namespace exprguard::obs {

std::string AstPrinter::print(const ast::Node& root) {
  ss_.str(""); ss_.clear(); depth_ = 0;
  emit(root);
  return ss_.str();
}

void AstPrinter::emit(const ast::Node& n) {
  indent();
  ss_ << describe(n) << "\n";
  depth_++;
  ast::forEachChild(n, [this](const ast::Node& child) { emit(child); });
  depth_--;
}

std::string AstPrinter::describe(const ast::Node& n) {
  std::ostringstream oss;
  oss << ast::to_string(n.kind);
  switch (n.kind) {
    case ast::NodeKind::IntLiteral: oss << " " << static_cast<const ast::IntLiteral&>(n).value; break;
    case ast::NodeKind::FloatLiteral: oss << " " << static_cast<const ast::FloatLiteral&>(n).value; break;
    case ast::NodeKind::BoolLiteral: oss << (static_cast<const ast::BoolLiteral&>(n).value ? " True" : " False"); break;
    case ast::NodeKind::StringLiteral: oss << " \"" << static_cast<const ast::StringLiteral&>(n).value << "\""; break;
    case ast::NodeKind::FStringLiteral: oss << " f\"" << static_cast<const ast::FStringLiteral&>(n).raw << "\""; break;
    case ast::NodeKind::Name: oss << " " << static_cast<const ast::Name&>(n).id; break;
    case ast::NodeKind::BinaryExpr: oss << " " << ast::to_symbol(static_cast<const ast::Binary&>(n).op); break;
    case ast::NodeKind::UnaryExpr: oss << " " << ast::to_symbol(static_cast<const ast::Unary&>(n).op); break;
    case ast::NodeKind::AugAssignStmt: oss << " " << ast::to_symbol(static_cast<const ast::AugAssignStmt&>(n).op) << "="; break;
    case ast::NodeKind::Attribute: oss << " ." << static_cast<const ast::Attribute&>(n).attr; break;
    case ast::NodeKind::Compare: {
      for (const auto op : static_cast<const ast::Compare&>(n).ops) { oss << " " << ast::to_symbol(op); }
      break;
    }
    case ast::NodeKind::Call: {
      const auto& call = static_cast<const ast::Call&>(n);
      for (const auto& kw : call.keywords) { oss << " " << kw.name << "="; }
      break;
    }
    default: break;
  }
  return oss.str();
}

} // namespace exprguard::obs
