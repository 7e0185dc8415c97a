/***
 * Name: ExtractWalker rejections
 * Purpose: Node kinds the parser accepts but a formula may not contain.
 */
#include "extract/detail/ExtractWalker.h"

namespace exprguard::extract::detail {

void ExtractWalker::visit(const ast::FStringLiteral& n) { throw reject(n, "f-string"); }
void ExtractWalker::visit(const ast::Attribute& n) { throw reject(n, "attribute access"); }
void ExtractWalker::visit(const ast::Subscript& n) { throw reject(n, "subscript"); }
void ExtractWalker::visit(const ast::LambdaExpr& n) { throw reject(n, "lambda"); }
void ExtractWalker::visit(const ast::IfExpr& n) { throw reject(n, "conditional expression"); }
void ExtractWalker::visit(const ast::NamedExpr& n) { throw reject(n, "assignment expression"); }
void ExtractWalker::visit(const ast::ListLiteral& n) { throw reject(n, "list display"); }
void ExtractWalker::visit(const ast::TupleLiteral& n) { throw reject(n, "tuple"); }
void ExtractWalker::visit(const ast::DictLiteral& n) { throw reject(n, "dict display"); }
void ExtractWalker::visit(const ast::SetLiteral& n) { throw reject(n, "set display"); }

} // namespace exprguard::extract::detail
