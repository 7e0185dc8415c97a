/***
 * Name: exprguard::schema::RuleSchema (impl)
 * Purpose: Build the rule maps and answer lookups.
 */
#include "schema/RuleSchema.h"
#include "schema/detail/BuildRules.h"
#include "exprguard/exceptions/schema_error.h"
#include <string>
#include <utility>

namespace exprguard::schema {

RuleSchema::RuleSchema(const OperatorTable& operators, const DatafieldTable& datafields) {
  for (const auto& [name, cfg] : operators) {
    operators_.emplace(name, detail::buildOperatorRule(name, cfg));
  }
  for (const auto& cfg : datafields) {
    auto decl = detail::buildDatafieldDecl(cfg);
    if (datafields_.count(decl.id) != 0) {
      throw exceptions::SchemaError("duplicate datafield id '" + decl.id + "'");
    }
    datafieldOrder_.push_back(decl.id);
    datafields_.emplace(decl.id, std::move(decl));
  }
}

const OperatorRule* RuleSchema::lookupOperator(const std::string& name) const {
  const auto it = operators_.find(name);
  return it == operators_.end() ? nullptr : &it->second;
}

const DatafieldDecl* RuleSchema::lookupDatafield(const std::string& id) const {
  const auto it = datafields_.find(id);
  return it == datafields_.end() ? nullptr : &it->second;
}

} // namespace exprguard::schema
