#include <array>
#include <charconv>
#include <cmath>
#include <unordered_map>

#include "utility.hpp"

namespace lox::util
{

std::string operator_token_to_string(lex::TokenType type)
{
    static const std::unordered_map<lex::TokenType, std::string> token_names = {
        {lex::TokenType::Plus, "+"},
        {lex::TokenType::Minus, "-"},
        {lex::TokenType::Star, "*"},
        {lex::TokenType::Slash, "/"},
        {lex::TokenType::EqualEqual, "=="},
        {lex::TokenType::BangEqual, "!="},
        {lex::TokenType::Less, "<"},
        {lex::TokenType::Greater, ">"},
        {lex::TokenType::LessEqual, "<="},
        {lex::TokenType::GreaterEqual, ">="},
        {lex::TokenType::And, "and"},
        {lex::TokenType::Or, "or"},
        {lex::TokenType::Bang, "!"}
    };
    auto it = token_names.find(type);
    return it != token_names.end() ? it->second : "unknown_operator";
}

std::string number_to_string(double number)
{
    if (std::isnan(number))
        return "NaN";
    if (std::isinf(number))
        return number > 0 ? "Infinity" : "-Infinity";

    // Fixed notation of a double never needs more than ~330 characters.
    std::array<char, 512> buffer{};
    auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), number, std::chars_format::fixed);
    if (ec != std::errc())
        return std::to_string(number);
    return std::string(buffer.data(), end);
}

} // namespace lox::util
