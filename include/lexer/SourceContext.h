/***
 * Name: exprguard::lex::formatContext
 * Purpose: Render "file:line:col: message" with the source line and a caret.
 * Inputs:
 *   - file/line/col: 1-based location
 *   - width: characters to underline (0 or 1 gives a lone caret)
 *   - head: message text
 *   - sourceLine: the offending line, or null when unavailable
 */
#pragma once

#include <cstddef>
#include <string>

namespace exprguard::lex {

std::string formatContext(const std::string& file, int line, int col, std::size_t width,
                          const std::string& head, const std::string* sourceLine);

} // namespace exprguard::lex
