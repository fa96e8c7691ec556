#pragma once

#include <cstddef>
#include <string>
#include <variant>

#include "../lexer/token.hpp"

namespace lox
{

using Value = std::variant<
    double,
    bool,
    std::string,
    std::nullptr_t,  // nil
    std::monostate   // unassigned: `var x;` without an initializer
>;

// nil only equals nil; values of different kinds are never equal.
bool operator==(const Value &lhs, const Value &rhs);

inline bool is_number(const Value &value) { return std::holds_alternative<double>(value); }
inline bool is_bool(const Value &value) { return std::holds_alternative<bool>(value); }
inline bool is_string(const Value &value) { return std::holds_alternative<std::string>(value); }
inline bool is_nil(const Value &value) { return std::holds_alternative<std::nullptr_t>(value); }
inline bool is_unassigned(const Value &value) { return std::holds_alternative<std::monostate>(value); }

inline double get_number(const Value &value) { return std::get<double>(value); }
inline bool get_bool(const Value &value) { return std::get<bool>(value); }
inline const std::string &get_string(const Value &value) { return std::get<std::string>(value); }

// nil and false are falsy, everything else is truthy.
bool is_truthy(const Value &value);

std::string value_to_string(const Value &value);

Value literal_to_value(const lex::Literal &literal);

}  // namespace lox
