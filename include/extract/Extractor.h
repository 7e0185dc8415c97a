/***
 * Name: exprguard::extract::Extractor
 * Purpose: Turn an expression text into an Extraction.
 * Inputs:
 *   - Expression text, or an already parsed Module
 *   - ExtractorOptions (comment marker, source name)
 * Outputs:
 *   - Extraction with operators, datafields, call sites and per-use records
 * Theory of Operation:
 *   Text after the comment marker is dropped, the remainder is parsed by
 *   parse::Parser, and each top-level statement is walked in order. A name
 *   bound by an assignment becomes local for the statements after it, so it
 *   is never reported as a datafield later. Assignments walk their value
 *   before binding, so a self reference still counts as a datafield.
 * Errors:
 *   SyntaxError from the front end propagates unchanged.
 *   UnsupportedConstruct for any node outside the formula subset.
 */
#pragma once

#include "ast/Module.h"
#include "extract/Extraction.h"
#include <memory>
#include <string>
#include <utility>

namespace exprguard::extract {

struct ExtractorOptions {
    std::string commentMarker{"-->"}; // empty disables stripping
    std::string sourceName{"<expr>"};
};

class Extractor {
 public:
  Extractor() = default;
  explicit Extractor(ExtractorOptions options) : options_(std::move(options)) {}

  Extraction extract(const std::string& text) const;
  // Walk a tree parsed elsewhere; sourceText (optional) feeds error context
  Extraction extract(std::unique_ptr<ast::Module> tree, const std::string& sourceText = {}) const;

  const ExtractorOptions& options() const { return options_; }

 private:
  ExtractorOptions options_{};
};

// Drop everything from the first marker outside a string literal
std::string stripTrailingComment(const std::string& text, const std::string& marker);

inline Extraction extract(const std::string& text, const ExtractorOptions& options = {}) {
  return Extractor(options).extract(text);
}

} // namespace exprguard::extract
