/***
 * Name: ExtractWalker statement visits
 * Purpose: Apply the binding rules of assignment, augmented assignment and
 *   bare expression statements. Control-flow statements are rejected.
 */
#include "extract/detail/ExtractWalker.h"
#include <string>
#include <vector>

namespace exprguard::extract::detail {

void ExtractWalker::visit(const ast::Module& n) {
  // Modules never nest; a Module reaching the walker is a caller error
  throw reject(n, "nested module");
}

void ExtractWalker::visit(const ast::AssignStmt& n) {
  std::vector<const ast::Name*> names;
  names.reserve(n.targets.size());
  for (const auto& t : n.targets) { names.push_back(&requireNameTarget(*t)); }
  walk(*n.value);
  for (const auto* name : names) { bind(name->id); }
}

void ExtractWalker::visit(const ast::AugAssignStmt& n) {
  const auto& target = requireNameTarget(*n.target);
  recordOperator(std::string(ast::to_symbol(n.op)) + "=", OperatorForm::Augmented, n.line, n.col);
  // x += e reads x before writing it
  readName(target);
  walk(*n.value);
  bind(target.id);
}

void ExtractWalker::visit(const ast::ExprStmt& n) {
  walk(*n.value);
}

void ExtractWalker::visit(const ast::IfStmt& n) { throw reject(n, "'if' statement"); }
void ExtractWalker::visit(const ast::WhileStmt& n) { throw reject(n, "'while' statement"); }
void ExtractWalker::visit(const ast::ForStmt& n) { throw reject(n, "'for' statement"); }
void ExtractWalker::visit(const ast::ReturnStmt& n) { throw reject(n, "'return' statement"); }
void ExtractWalker::visit(const ast::PassStmt& n) { throw reject(n, "'pass' statement"); }

} // namespace exprguard::extract::detail
