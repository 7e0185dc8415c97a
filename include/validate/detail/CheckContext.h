/**
 * @file
 * @brief Shared inputs and output sink of the category checks.
 */
#pragma once

#include "extract/Extraction.h"
#include "schema/RuleSchema.h"
#include "validate/Validator.h"
#include "validate/Violation.h"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace exprguard::validate::detail {

struct CheckContext {
    const extract::Extraction& extraction;
    const schema::RuleSchema& schema;
    const ValidatorOptions& options;
    std::vector<Violation>& out;
};

void addViolation(std::vector<Violation>& out, Category category, const std::string& subject,
                  const std::string& detail, int line, int col,
                  std::optional<size_t> callIndex = std::nullopt, const std::string& keyword = {});

} // namespace exprguard::validate::detail
