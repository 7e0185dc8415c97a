/***
 * Name: exprguard::schema::to_display
 * Purpose: Render a configured literal value for messages.
 */
#include "schema/LiteralValue.h"
#include <sstream>
#include <string>
#include <type_traits>
#include <variant>

namespace exprguard::schema {

std::string to_display(const LiteralValue& value) {
  return std::visit([](const auto& v) -> std::string {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, std::monostate>) {
      return "None";
    } else if constexpr (std::is_same_v<T, bool>) {
      return v ? "True" : "False";
    } else if constexpr (std::is_same_v<T, int64_t>) {
      return std::to_string(v);
    } else if constexpr (std::is_same_v<T, double>) {
      std::ostringstream oss;
      oss << v;
      auto s = oss.str();
      if (s.find_first_of(".eEni") == std::string::npos) { s += ".0"; }
      return s;
    } else {
      return "'" + v + "'";
    }
  }, value);
}

} // namespace exprguard::schema
