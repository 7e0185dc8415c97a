/***
 * Name: exprguard::obs::AstPrinter
 * Purpose: AST pretty-printer for diagnostics/logging.
 * Inputs:
 *   - ast::Module (or any node)
 * Outputs:
 *   - Formatted string with node kinds and salient fields, one node per line.
 * Theory of Operation:
 *   describe() names the node and its scalar fields; ast::forEachChild
 *   drives the recursion, with indentation reflecting tree depth.
 */
#pragma once

#include <sstream>
#include <string>
#include "ast/Nodes.h"

namespace exprguard::obs {

class AstPrinter {
 public:
  std::string print(const ast::Node& root);

  // One-line description of a single node ("Name close", "Call", ...)
  static std::string describe(const ast::Node& n);

 private:
  void emit(const ast::Node& n);
  void indent() { for (int i = 0; i < depth_; ++i) ss_ << "  "; }
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace exprguard::obs
