/***
 * Name: exprguard::schema::RuleSchema
 * Purpose: Immutable operator rules and datafield declarations with lookups.
 * Inputs:
 *   - OperatorTable and DatafieldTable (see schema/Config.h)
 * Outputs:
 *   - lookupOperator / lookupDatafield returning a pointer or nullptr.
 * Theory of Operation:
 *   The constructor converts every configuration entry into a typed rule and
 *   throws SchemaError on the first inconsistency, so a constructed schema
 *   is always well formed. Nothing mutates it afterwards; one instance may be
 *   shared by concurrent validations.
 */
#pragma once

#include "schema/Config.h"
#include "schema/LiteralValue.h"
#include "schema/Types.h"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace exprguard::schema {

struct KwargRule {
    std::string name;
    ValueType type{ValueType::Any};
    std::optional<std::vector<LiteralValue>> allowed;
    std::optional<double> minVal;
    std::optional<double> maxVal;
    bool minInclusive{true};
    bool maxInclusive{true};
};

struct OperatorRule {
    std::string name;
    int minArgs{0};
    int maxArgs{-1}; // -1: unbounded
    std::map<std::string, KwargRule> kwargs;

    bool unbounded() const { return maxArgs < 0; }
    const KwargRule* findKwarg(const std::string& kw) const {
        const auto it = kwargs.find(kw);
        return it == kwargs.end() ? nullptr : &it->second;
    }
};

struct DatafieldDecl {
    std::string id;
    DatafieldKind kind{DatafieldKind::Matrix};
};

class RuleSchema {
 public:
  RuleSchema(const OperatorTable& operators, const DatafieldTable& datafields);

  const OperatorRule* lookupOperator(const std::string& name) const;
  const DatafieldDecl* lookupDatafield(const std::string& id) const;

  size_t operatorCount() const { return operators_.size(); }
  size_t datafieldCount() const { return datafieldOrder_.size(); }
  // Datafield ids in table order
  const std::vector<std::string>& datafieldIds() const { return datafieldOrder_; }

 private:
  std::unordered_map<std::string, OperatorRule> operators_;
  std::unordered_map<std::string, DatafieldDecl> datafields_;
  std::vector<std::string> datafieldOrder_;
};

} // namespace exprguard::schema
