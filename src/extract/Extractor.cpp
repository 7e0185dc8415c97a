/***
 * Name: exprguard::extract::Extractor (impl)
 * Purpose: Parse the text and run ExtractWalker over each statement.
 */
#include "extract/Extractor.h"
#include "extract/detail/ExtractWalker.h"
#include "exprguard/exceptions/validation_input_error.h"
#include "parser/Parser.h"
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace exprguard::extract {

namespace {
std::vector<std::string> splitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') { line.pop_back(); }
    lines.push_back(line);
  }
  return lines;
}
} // namespace

Extraction Extractor::extract(const std::string& text) const {
  const auto body = stripTrailingComment(text, options_.commentMarker);
  auto tree = parse::Parser::parseExpressionText(body, options_.sourceName);
  return extract(std::move(tree), body);
}

Extraction Extractor::extract(std::unique_ptr<ast::Module> tree, const std::string& sourceText) const {
  if (!tree) { throw exceptions::ValidationInputError("extract: no expression tree"); }
  Extraction out;
  out.tree = std::move(tree);
  const auto lines = splitLines(sourceText);
  detail::ExtractWalker walker(out, lines.empty() ? nullptr : &lines);
  for (const auto& stmt : out.tree->body) {
    if (stmt) { walker.walkStatement(*stmt); }
  }
  return out;
}

} // namespace exprguard::extract
