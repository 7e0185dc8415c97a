/**
 * @file
 * @brief Conversion of configuration entries into typed rules; each throws SchemaError.
 */
#pragma once

#include "schema/Config.h"
#include "schema/RuleSchema.h"
#include <string>

namespace exprguard::schema::detail {

KwargRule buildKwargRule(const std::string& op, const std::string& kw, const KwargConfig& cfg);
OperatorRule buildOperatorRule(const std::string& name, const OperatorConfig& cfg);
DatafieldDecl buildDatafieldDecl(const DatafieldConfig& cfg);

} // namespace exprguard::schema::detail
