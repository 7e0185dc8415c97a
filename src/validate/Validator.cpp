/***
 * Name: exprguard::validate::Validator (impl)
 * Purpose: Run the category checks in order and wrap the result.
 */
#include "validate/Validator.h"
#include "exprguard/exceptions/validation_input_error.h"
#include "validate/detail/Checks.h"
#include <utility>
#include <vector>

namespace exprguard::validate {

ValidationReport Validator::validate(const extract::Extraction& extraction) const {
  if (!extraction.tree) {
    throw exceptions::ValidationInputError("validate: extraction has no tree (moved-from?)");
  }
  std::vector<Violation> out;
  detail::CheckContext ctx{extraction, schema_, options_, out};
  detail::checkOperatorMembership(ctx);
  detail::checkDatafieldMembership(ctx);
  detail::checkArity(ctx);
  detail::checkUnknownKwarg(ctx);
  detail::checkKwargType(ctx);
  detail::checkKwargRange(ctx);
  detail::checkKwargAllowed(ctx);
  detail::checkVectorScope(ctx);
  return ValidationReport(std::move(out));
}

ValidationReport validate(const extract::Extraction& extraction, const schema::RuleSchema& schema,
                          const ValidatorOptions& options) {
  return Validator(schema, options).validate(extraction);
}

} // namespace exprguard::validate
