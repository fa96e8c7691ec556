#pragma once

#include <string>

#include "../lexer/token.hpp"

namespace lox::util {

std::string operator_token_to_string(lex::TokenType type);

// Shortest text that reads back as `number`; integral values print without ".0".
// Non-finite values print as Infinity, -Infinity and NaN.
std::string number_to_string(double number);

} // namespace lox::util
