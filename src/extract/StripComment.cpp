/***
 * Name: exprguard::extract::stripTrailingComment
 * Purpose: Cut an expression text at the first comment marker.
 * Theory of Operation:
 *   Scans left to right tracking single and double quoted strings (with
 *   backslash escapes) so a marker inside a string literal is kept. Strings
 *   never span lines, so a newline closes an unterminated one. Quotes after
 *   '#' are comment text and open nothing; a marker there still cuts.
 */
#include "extract/Extractor.h"
#include <cstddef>
#include <string>

namespace exprguard::extract {

std::string stripTrailingComment(const std::string& text, const std::string& marker) {
  if (marker.empty()) { return text; }
  char quote = 0;
  bool inComment = false;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\n') { quote = 0; inComment = false; continue; }
    if (quote != 0) {
      if (c == '\\') { ++i; continue; }
      if (c == quote) { quote = 0; }
      continue;
    }
    if (text.compare(i, marker.size(), marker) == 0) { return text.substr(0, i); }
    if (inComment) { continue; }
    if (c == '#') { inComment = true; continue; }
    if (c == '\'' || c == '"') { quote = c; }
  }
  return text;
}

} // namespace exprguard::extract
