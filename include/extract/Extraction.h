/***
 * Name: exprguard::extract::Extraction
 * Purpose: Structural summary of one expression text.
 * Inputs:
 *   - Produced by Extractor; read by the validator.
 * Outputs:
 *   - operators: distinct operator tokens in first-appearance order
 *   - datafields: distinct free names in first-appearance order
 *   - callSites: one entry per call, indexed in pre-order
 *   - operatorUses / datafieldUses: every occurrence with its position
 * Theory of Operation:
 *   The Extraction owns the parsed tree. CallSite argument pointers refer
 *   into that tree, so the type is move-only; moving keeps the pointers
 *   valid because the tree itself never moves.
 */
#pragma once

#include "ast/Nodes.h"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace exprguard::extract {

struct KeywordArgument {
    std::string name;
    const ast::Expr* value{nullptr};
    int line{0};
    int col{0};
};

struct CallSite {
    size_t index{0};                          // pre-order position among all calls
    std::string op;                           // callee name
    std::vector<const ast::Expr*> positional;
    std::vector<KeywordArgument> keywords;    // source order, names unique
    int line{0};
    int col{0};

    const KeywordArgument* findKeyword(const std::string& name) const {
        for (const auto& kw : keywords) {
            if (kw.name == name) { return &kw; }
        }
        return nullptr;
    }
};

enum class OperatorForm { Call, Binary, Compare, Boolean, Unary, Augmented };

const char* to_string(OperatorForm form);

struct OperatorUse {
    std::string op;
    OperatorForm form{OperatorForm::Binary};
    int line{0};
    int col{0};
    std::optional<size_t> callIndex; // set for OperatorForm::Call
    std::optional<size_t> operandCount; // set for an 'and'/'or' chain
};

struct DatafieldUse {
    std::string name;
    int line{0};
    int col{0};
    std::vector<size_t> enclosingCalls; // call indices, outermost first
};

struct Extraction {
    std::unique_ptr<ast::Module> tree;
    std::vector<std::string> operators;
    std::vector<std::string> datafields;
    std::vector<CallSite> callSites;
    std::vector<OperatorUse> operatorUses;
    std::vector<DatafieldUse> datafieldUses;
    std::vector<std::string> boundNames; // in binding order

    Extraction() = default;
    Extraction(const Extraction&) = delete;
    Extraction& operator=(const Extraction&) = delete;
    Extraction(Extraction&&) noexcept = default;
    Extraction& operator=(Extraction&&) noexcept = default;
    ~Extraction() = default;

    size_t statementCount() const { return tree ? tree->body.size() : 0; }
};

} // namespace exprguard::extract
