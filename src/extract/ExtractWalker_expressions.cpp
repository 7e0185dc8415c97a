/***
 * Name: ExtractWalker expression visits
 * Purpose: Record names, calls and operator symbols of the formula subset.
 */
#include "extract/detail/ExtractWalker.h"
#include "exprguard/exceptions/validation_input_error.h"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace exprguard::extract::detail {

namespace {
OperatorForm formOf(const ast::BinaryOperator op) {
  switch (op) {
    case ast::BinaryOperator::Eq:
    case ast::BinaryOperator::Ne:
    case ast::BinaryOperator::Lt:
    case ast::BinaryOperator::Le:
    case ast::BinaryOperator::Gt:
    case ast::BinaryOperator::Ge:
    case ast::BinaryOperator::Is:
    case ast::BinaryOperator::IsNot:
    case ast::BinaryOperator::In:
    case ast::BinaryOperator::NotIn:
      return OperatorForm::Compare;
    default:
      return OperatorForm::Binary;
  }
}
} // namespace

void ExtractWalker::visit(const ast::Name& n) {
  readName(n);
}

// NOLINTNEXTLINE(readability-function-cognitive-complexity)
void ExtractWalker::visit(const ast::Call& n) {
  if (n.callee->kind != ast::NodeKind::Name) { throw reject(*n.callee, "non-name call target"); }
  if (!n.starArgs.empty()) { throw reject(*n.starArgs.front(), "star argument"); }
  if (!n.kwStarArgs.empty()) { throw reject(*n.kwStarArgs.front(), "keyword unpacking"); }
  const auto& op = static_cast<const ast::Name&>(*n.callee).id;

  // Reserve the slot first so nested calls get later (pre-order) indices
  const size_t index = out_.callSites.size();
  out_.callSites.emplace_back();
  recordOperator(op, OperatorForm::Call, n.line, n.col, index);

  CallSite site;
  site.index = index;
  site.op = op;
  site.line = n.line;
  site.col = n.col;
  openCalls_.push_back(index);
  for (const auto& arg : n.args) {
    walk(*arg);
    site.positional.push_back(arg.get());
  }
  for (const auto& kw : n.keywords) {
    walk(*kw.value);
    site.keywords.push_back(KeywordArgument{kw.name, kw.value.get(), kw.line, kw.col});
  }
  openCalls_.pop_back();
  out_.callSites[index] = std::move(site);
}

// One use per 'and'/'or' chain, located at its first operator token
void ExtractWalker::walkBooleanChain(const ast::Binary& head) {
  const size_t count = head.operands < 2 ? 2 : head.operands;
  std::vector<const ast::Expr*> operands(count);
  const ast::Binary* node = &head;
  for (size_t i = count - 1; i > 1; --i) {
    operands[i] = node->rhs.get();
    const auto* next = node->lhs.get();
    if (next->kind != ast::NodeKind::BinaryExpr || static_cast<const ast::Binary*>(next)->op != head.op) {
      throw exceptions::ValidationInputError("extract: '" + std::string(ast::to_symbol(head.op)) +
                                             "' chain is shorter than its operand count");
    }
    node = static_cast<const ast::Binary*>(next);
  }
  operands[1] = node->rhs.get();
  operands[0] = node->lhs.get();

  walk(*operands[0]);
  recordOperator(ast::to_symbol(head.op), OperatorForm::Boolean, node->line, node->col, std::nullopt, count);
  for (size_t i = 1; i < operands.size(); ++i) { walk(*operands[i]); }
}

void ExtractWalker::visit(const ast::Binary& n) {
  if (n.op == ast::BinaryOperator::And || n.op == ast::BinaryOperator::Or) {
    walkBooleanChain(n);
    return;
  }
  walk(*n.lhs);
  recordOperator(ast::to_symbol(n.op), formOf(n.op), n.line, n.col);
  walk(*n.rhs);
}

void ExtractWalker::visit(const ast::Compare& n) {
  walk(*n.left);
  for (size_t i = 0; i < n.ops.size(); ++i) {
    const auto& pos = n.opPositions[i];
    recordOperator(ast::to_symbol(n.ops[i]), OperatorForm::Compare, pos.first, pos.second);
    walk(*n.comparators[i]);
  }
}

void ExtractWalker::visit(const ast::Unary& n) {
  const auto form = n.op == ast::UnaryOperator::Not ? OperatorForm::Boolean : OperatorForm::Unary;
  recordOperator(ast::to_symbol(n.op), form, n.line, n.col);
  walk(*n.operand);
}

} // namespace exprguard::extract::detail
