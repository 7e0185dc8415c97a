/***
 * Name: exprguard::extract::detail::ExtractWalker
 * Purpose: Statement-by-statement walk that fills an Extraction.
 * Theory of Operation:
 *   Nodes are routed through ast::dispatch, which names every NodeKind; the
 *   walker provides one visit per node type. Supported kinds record
 *   operators, datafields and call sites; all others throw
 *   UnsupportedConstruct at the node's position. The stack of open call
 *   indices gives each datafield use its enclosing calls.
 */
#pragma once

#include "ast/Nodes.h"
#include "exprguard/exceptions/unsupported_construct.h"
#include "extract/Extraction.h"
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace exprguard::extract::detail {

class ExtractWalker {
 public:
  ExtractWalker(Extraction& out, const std::vector<std::string>* sourceLines)
      : out_(out), sourceLines_(sourceLines) {}

  void walkStatement(const ast::Stmt& stmt);

  // Statements
  void visit(const ast::Module& n);
  void visit(const ast::AssignStmt& n);
  void visit(const ast::AugAssignStmt& n);
  void visit(const ast::ExprStmt& n);
  void visit(const ast::IfStmt& n);
  void visit(const ast::WhileStmt& n);
  void visit(const ast::ForStmt& n);
  void visit(const ast::ReturnStmt& n);
  void visit(const ast::PassStmt& n);

  // Expressions
  void visit(const ast::IntLiteral&) {}
  void visit(const ast::FloatLiteral&) {}
  void visit(const ast::StringLiteral&) {}
  void visit(const ast::BoolLiteral&) {}
  void visit(const ast::NoneLiteral&) {}
  void visit(const ast::FStringLiteral& n);
  void visit(const ast::Name& n);
  void visit(const ast::Call& n);
  void visit(const ast::Binary& n);
  void visit(const ast::Compare& n);
  void visit(const ast::Unary& n);
  void visit(const ast::Attribute& n);
  void visit(const ast::Subscript& n);
  void visit(const ast::LambdaExpr& n);
  void visit(const ast::IfExpr& n);
  void visit(const ast::NamedExpr& n);
  void visit(const ast::ListLiteral& n);
  void visit(const ast::TupleLiteral& n);
  void visit(const ast::DictLiteral& n);
  void visit(const ast::SetLiteral& n);

 private:
  Extraction& out_;
  const std::vector<std::string>* sourceLines_;
  std::unordered_set<std::string> bound_;
  std::unordered_set<std::string> seenOperators_;
  std::unordered_set<std::string> seenDatafields_;
  std::vector<size_t> openCalls_;

  void walk(const ast::Expr& e);
  void recordOperator(const std::string& op, OperatorForm form, int line, int col,
                      std::optional<size_t> callIndex = std::nullopt,
                      std::optional<size_t> operandCount = std::nullopt);
  void walkBooleanChain(const ast::Binary& head);
  void readName(const ast::Name& n);
  void bind(const std::string& name);
  const ast::Name& requireNameTarget(const ast::Expr& target) const;
  exceptions::UnsupportedConstruct reject(const ast::Node& n, const std::string& construct) const;
};

} // namespace exprguard::extract::detail
