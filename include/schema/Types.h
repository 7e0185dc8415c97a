/***
 * Name: exprguard::schema types
 * Purpose: Keyword value types and datafield kinds recognized by the schema.
 * Theory of Operation:
 *   Configuration names types and kinds by string; parseValueType and
 *   parseDatafieldKind map them onto closed enumerations and report
 *   unknown names by returning false.
 */
#pragma once

#include <string>

namespace exprguard::schema {

enum class ValueType {
    Bool,
    Int,
    Float,
    Str,
    Number, // int or float
    Any     // any literal
};

enum class DatafieldKind {
    Matrix,
    Vector,
    Group
};

const char* to_string(ValueType type);
const char* to_string(DatafieldKind kind);

bool parseValueType(const std::string& text, ValueType& out);
bool parseDatafieldKind(const std::string& text, DatafieldKind& out);

inline bool isNumeric(const ValueType type) {
    return type == ValueType::Int || type == ValueType::Float || type == ValueType::Number;
}

} // namespace exprguard::schema
