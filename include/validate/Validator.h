/***
 * Name: exprguard::validate::Validator
 * Purpose: Check an Extraction against a RuleSchema.
 * Inputs:
 *   - extract::Extraction (read only)
 *   - schema::RuleSchema
 *   - ValidatorOptions
 * Outputs:
 *   - ValidationReport listing every violation
 * Theory of Operation:
 *   Runs every category check in a fixed order with no early exit:
 *     1. operator membership    5. keyword type
 *     2. datafield membership   6. keyword range
 *     3. arity                  7. keyword allowed set
 *     4. keyword names          8. vector scope
 *   Arity covers positional counts, int lookback literals of series
 *   operators, and the operand count of 'and'/'or' chains.
 *   Each check appends in order of first appearance, so the report is
 *   sorted by category and then by position, and equal inputs produce
 *   equal reports.
 * Errors:
 *   Invalid expressions are reported, never thrown. ValidationInputError is
 *   thrown only for an extraction without a tree (moved-from).
 */
#pragma once

#include "extract/Extraction.h"
#include "schema/RuleSchema.h"
#include "validate/ValidationReport.h"
#include <string>
#include <utility>

namespace exprguard::validate {

struct ValidatorOptions {
    std::string vectorPrefix{"vec_"};
    std::string seriesPrefix{"ts_"}; // required literal positionals of these operators must be int
    bool widenIntToFloat{true}; // int literal satisfies a float keyword
};

class Validator {
 public:
  explicit Validator(const schema::RuleSchema& schema, ValidatorOptions options = {})
      : schema_(schema), options_(std::move(options)) {}

  ValidationReport validate(const extract::Extraction& extraction) const;

 private:
  const schema::RuleSchema& schema_;
  ValidatorOptions options_;
};

ValidationReport validate(const extract::Extraction& extraction, const schema::RuleSchema& schema,
                          const ValidatorOptions& options = {});

} // namespace exprguard::validate
