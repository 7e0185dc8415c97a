/***
 * Name: exprguard::schema configuration tables
 * Purpose: Declarative input to RuleSchema, one struct per table entry.
 * Inputs:
 *   - Operator table: operator name -> arity bounds and keyword declarations.
 *   - Datafield table: ordered {id, type} entries.
 * Outputs:
 *   - Plain values; RuleSchema validates them on construction.
 * Theory of Operation:
 *   The fields mirror the JSON rule files consumed by the formula tool
 *   (min_args, max_args, kwargs{type, allowed, min_val, max_val,
 *   min_inclusive, max_inclusive}; datafield id and type). Loading those files
 *   is left to the caller.
 */
#pragma once

#include "schema/LiteralValue.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace exprguard::schema {

struct KwargConfig {
    std::string type;                                  // "bool" | "int" | "float" | "str" | "number" | "any"
    std::optional<std::vector<LiteralValue>> allowed;
    std::optional<double> minVal;
    std::optional<double> maxVal;
    std::optional<bool> minInclusive;                  // absent means true
    std::optional<bool> maxInclusive;                  // absent means true
};

struct OperatorConfig {
    std::optional<int> minArgs;                        // absent means 0
    std::optional<int> maxArgs;                        // absent or -1 means unbounded
    std::map<std::string, KwargConfig> kwargs;
};

using OperatorTable = std::map<std::string, OperatorConfig>;

struct DatafieldConfig {
    std::string id;
    std::string type;                                  // "MATRIX" | "VECTOR" | "GROUP"
};

using DatafieldTable = std::vector<DatafieldConfig>;

} // namespace exprguard::schema
