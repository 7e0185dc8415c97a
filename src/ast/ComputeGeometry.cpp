/***
 * Name: exprguard::ast::ComputeGeometry
 * Purpose: Compute AST geometry (node count and maximum depth) via DFS.
 * Inputs:
 *   - module: AST root node
 * Outputs:
 *   - node count and maximum depth (the module itself is depth 1)
 */
#include <algorithm>
#include <cstdint>

#include "ast/Children.h"
#include "ast/GeometrySummary.h"

namespace exprguard::ast {

static void DepthFirstAccumulate(const Node& node, uint64_t depth, GeometrySummary& out) {
  out.maxDepth = std::max(depth, out.maxDepth);
  ++out.nodes;
  forEachChild(node, [&](const Node& child) { DepthFirstAccumulate(child, depth + 1, out); });
}

GeometrySummary ComputeGeometry(const Module& module) {
  GeometrySummary out{};
  constexpr uint64_t kInitialDepth = 1U;
  DepthFirstAccumulate(module, kInitialDepth, out);
  return out;
}

} // namespace exprguard::ast
