/***
 * Name: exprguard::Gate
 * Purpose: One-call facade: extract an expression, validate it, record metrics.
 * Inputs:
 *   - Shared immutable RuleSchema
 *   - GateOptions (extractor/validator options, logging switches)
 * Outputs:
 *   - GateResult holding the Extraction and its ValidationReport
 * Theory of Operation:
 *   check() runs Extractor then Validator, timing both stages in
 *   obs::Metrics and counting statements, call sites and violations per
 *   category. With logTokens/logAst set, the token stream and the parsed
 *   tree are written to the log stream (std::cerr when none is given).
 *   Extraction failures are logged as "exprguard: <message>" and rethrown.
 *   A Gate accumulates metrics and is not thread-safe; the schema it holds
 *   may be shared by any number of gates.
 */
#pragma once

#include "extract/Extraction.h"
#include "extract/Extractor.h"
#include "observability/Metrics.h"
#include "schema/RuleSchema.h"
#include "validate/ValidationReport.h"
#include "validate/Validator.h"
#include <memory>
#include <ostream>
#include <string>

namespace exprguard {

struct GateOptions {
    extract::ExtractorOptions extractor{};
    validate::ValidatorOptions validator{};
    bool metrics{true};
    bool logAst{false};
    bool logTokens{false};
    std::ostream* log{nullptr}; // diagnostics sink; null means std::cerr for dumps, silence for errors
};

struct GateResult {
    extract::Extraction extraction;
    validate::ValidationReport report;

    bool ok() const { return report.ok(); }
};

class Gate {
 public:
  explicit Gate(std::shared_ptr<const schema::RuleSchema> schema, GateOptions options = {});

  GateResult check(const std::string& expression);

  const schema::RuleSchema& schema() const { return *schema_; }
  const GateOptions& options() const { return options_; }
  const obs::Metrics& metrics() const { return metrics_; }
  obs::Metrics& metrics() { return metrics_; }

 private:
  std::shared_ptr<const schema::RuleSchema> schema_;
  GateOptions options_;
  extract::Extractor extractor_;
  obs::Metrics metrics_{};

  std::ostream& dumpStream() const;
  void dumpTokens(const std::string& expression) const;
  void record(const extract::Extraction& extraction, const validate::ValidationReport& report);
};

} // namespace exprguard
