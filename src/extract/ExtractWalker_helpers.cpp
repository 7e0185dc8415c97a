/***
 * Name: ExtractWalker helpers
 * Purpose: Bookkeeping shared by the visit functions.
 */
#include "extract/detail/ExtractWalker.h"
#include "ast/Visitor.h"
#include "lexer/SourceContext.h"
#include <cstddef>
#include <optional>
#include <string>

namespace exprguard::extract::detail {

void ExtractWalker::walkStatement(const ast::Stmt& stmt) {
  ast::dispatch(stmt, *this);
}

void ExtractWalker::walk(const ast::Expr& e) {
  ast::dispatch(e, *this);
}

void ExtractWalker::recordOperator(const std::string& op, const OperatorForm form, const int line, const int col,
                                   const std::optional<size_t> callIndex,
                                   const std::optional<size_t> operandCount) {
  out_.operatorUses.push_back(OperatorUse{op, form, line, col, callIndex, operandCount});
  if (seenOperators_.insert(op).second) { out_.operators.push_back(op); }
}

void ExtractWalker::readName(const ast::Name& n) {
  if (bound_.count(n.id) != 0) { return; }
  out_.datafieldUses.push_back(DatafieldUse{n.id, n.line, n.col, openCalls_});
  if (seenDatafields_.insert(n.id).second) { out_.datafields.push_back(n.id); }
}

void ExtractWalker::bind(const std::string& name) {
  if (bound_.insert(name).second) { out_.boundNames.push_back(name); }
}

const ast::Name& ExtractWalker::requireNameTarget(const ast::Expr& target) const {
  if (target.kind != ast::NodeKind::Name) {
    throw reject(target, std::string("assignment to ") + ast::to_string(target.kind));
  }
  return static_cast<const ast::Name&>(target);
}

exceptions::UnsupportedConstruct ExtractWalker::reject(const ast::Node& n, const std::string& construct) const {
  const std::string* srcLine = nullptr;
  if (sourceLines_ != nullptr && n.line > 0 && static_cast<size_t>(n.line) <= sourceLines_->size()) {
    srcLine = &(*sourceLines_)[static_cast<size_t>(n.line) - 1];
  }
  const auto msg = lex::formatContext(n.file, n.line, n.col, 1,
                                      construct + " is not supported in expressions", srcLine);
  return exceptions::UnsupportedConstruct(construct, msg, n.line, n.col);
}

} // namespace exprguard::extract::detail
