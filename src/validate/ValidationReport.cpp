/***
 * Name: exprguard::validate::ValidationReport (impl)
 * Purpose: Counting and text/JSON rendering.
 */
#include "validate/ValidationReport.h"
#include <cstddef>
#include <cstdio>
#include <sstream>
#include <string>

namespace exprguard::validate {

namespace {
std::string jsonEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (const char c : s) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  return out;
}
} // namespace

size_t ValidationReport::count(const Category category) const {
  size_t n = 0;
  for (const auto& v : violations_) {
    if (v.category == category) { ++n; }
  }
  return n;
}

std::string ValidationReport::toText() const {
  if (violations_.empty()) { return "ok\n"; }
  std::ostringstream oss;
  for (const auto& v : violations_) { oss << v.message() << "\n"; }
  return oss.str();
}

std::string ValidationReport::toJson() const {
  std::ostringstream oss;
  oss << "{\n  \"ok\": " << (ok() ? "true" : "false") << ",\n  \"violations\": [";
  bool first = true;
  for (const auto& v : violations_) {
    if (!first) { oss << ","; }
    first = false;
    oss << "\n    { \"category\": \"" << to_string(v.category) << "\""
        << ", \"subject\": \"" << jsonEscape(v.subject) << "\"";
    if (v.callIndex) { oss << ", \"call_index\": " << *v.callIndex; }
    if (!v.keyword.empty()) { oss << ", \"keyword\": \"" << jsonEscape(v.keyword) << "\""; }
    oss << ", \"detail\": \"" << jsonEscape(v.detail) << "\""
        << ", \"line\": " << v.line << ", \"col\": " << v.col << " }";
  }
  oss << (violations_.empty() ? "]" : "\n  ]") << "\n}\n";
  return oss.str();
}

} // namespace exprguard::validate
