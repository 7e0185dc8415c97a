/***
 * Name: exprguard::lex::formatContext
 * Purpose: Shared caret-context formatting for lexer and parser errors.
 */
#include "lexer/SourceContext.h"

#include <sstream>
#include <string>

namespace exprguard::lex {

std::string formatContext(const std::string& file, const int line, const int col, const std::size_t width,
                          const std::string& head, const std::string* sourceLine) {
  std::ostringstream out;
  out << file << ":" << line << ":" << col << ": " << head;
  if (sourceLine != nullptr && line > 0) {
    out << "\n" << *sourceLine;
    std::string caret;
    const int c = col < 1 ? 1 : col;
    caret.assign(static_cast<std::size_t>(c - 1), ' ');
    caret.push_back('^');
    if (width > 1) { caret.append(width - 1, '~'); }
    out << "\n" << caret;
  }
  return out.str();
}

} // namespace exprguard::lex
