/***
 * Name: exprguard::schema type names
 * Purpose: Map configuration strings onto ValueType and DatafieldKind.
 */
#include "schema/Types.h"
#include <string>

namespace exprguard::schema {

const char* to_string(const ValueType type) {
  switch (type) {
    case ValueType::Bool: return "bool";
    case ValueType::Int: return "int";
    case ValueType::Float: return "float";
    case ValueType::Str: return "str";
    case ValueType::Number: return "number";
    case ValueType::Any: return "any";
  }
  return "any";
}

const char* to_string(const DatafieldKind kind) {
  switch (kind) {
    case DatafieldKind::Matrix: return "MATRIX";
    case DatafieldKind::Vector: return "VECTOR";
    case DatafieldKind::Group: return "GROUP";
  }
  return "MATRIX";
}

bool parseValueType(const std::string& text, ValueType& out) {
  for (const auto t : {ValueType::Bool, ValueType::Int, ValueType::Float,
                       ValueType::Str, ValueType::Number, ValueType::Any}) {
    if (text == to_string(t)) { out = t; return true; }
  }
  return false;
}

// Kind names are case-sensitive, as written in the datafield table
bool parseDatafieldKind(const std::string& text, DatafieldKind& out) {
  for (const auto k : {DatafieldKind::Matrix, DatafieldKind::Vector, DatafieldKind::Group}) {
    if (text == to_string(k)) { out = k; return true; }
  }
  return false;
}

} // namespace exprguard::schema
