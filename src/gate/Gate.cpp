/***
 * Name: exprguard::Gate (impl)
 * Purpose: Run extract and validate with metrics and optional dumps.
 */
#include "exprguard/Gate.h"
#include "ast/GeometrySummary.h"
#include "exprguard/exceptions/exprguard_exception.h"
#include "exprguard/exceptions/validation_input_error.h"
#include "lexer/Lexer.h"
#include "observability/AstPrinter.h"
#include "validate/Category.h"
#include <iostream>
#include <memory>
#include <ostream>
#include <string>
#include <utility>

namespace exprguard {

Gate::Gate(std::shared_ptr<const schema::RuleSchema> schema, GateOptions options)
    : schema_(std::move(schema)), options_(std::move(options)), extractor_(options_.extractor) {
  if (!schema_) { throw exceptions::ValidationInputError("gate: no rule schema"); }
}

std::ostream& Gate::dumpStream() const {
  return options_.log != nullptr ? *options_.log : std::cerr;
}

void Gate::dumpTokens(const std::string& expression) const {
  lex::Lexer L;
  L.pushString(extract::stripTrailingComment(expression, options_.extractor.commentMarker),
               options_.extractor.sourceName);
  auto& out = dumpStream();
  for (const auto& tok : L.tokens()) {
    out << tok.line << ":" << tok.col << " " << lex::to_string(tok.kind);
    if (!tok.text.empty() && tok.kind != lex::TokenKind::Newline) { out << " '" << tok.text << "'"; }
    out << "\n";
  }
}

void Gate::record(const extract::Extraction& extraction, const validate::ValidationReport& report) {
  metrics_.incCounter("checks");
  metrics_.incCounter("statements", extraction.statementCount());
  metrics_.incCounter("call_sites", extraction.callSites.size());
  metrics_.incCounter("violations", report.size());
  for (const auto category : validate::kAllCategories) {
    const auto n = report.count(category);
    if (n > 0) { metrics_.incCounter(std::string("violations.") + validate::to_string(category), n); }
  }
  const auto geom = ast::ComputeGeometry(*extraction.tree);
  metrics_.setAstGeometry(obs::AstGeometry{geom.nodes, geom.maxDepth});
}

GateResult Gate::check(const std::string& expression) {
  try {
    if (options_.logTokens) { dumpTokens(expression); }
    if (options_.metrics) { metrics_.start("extract"); }
    auto extraction = extractor_.extract(expression);
    if (options_.metrics) { metrics_.stop("extract"); }
    if (options_.logAst) { dumpStream() << obs::AstPrinter().print(*extraction.tree); }

    if (options_.metrics) { metrics_.start("validate"); }
    auto report = validate::validate(extraction, *schema_, options_.validator);
    if (options_.metrics) {
      metrics_.stop("validate");
      record(extraction, report);
    }
    return GateResult{std::move(extraction), std::move(report)};
  } catch (const exceptions::ExprguardException& ex) {
    if (options_.metrics) {
      metrics_.stop("extract");
      metrics_.stop("validate");
      metrics_.incCounter("failures");
    }
    if (options_.log != nullptr) { *options_.log << "exprguard: " << ex.what() << "\n"; }
    throw;
  }
}

} // namespace exprguard
