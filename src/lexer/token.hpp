#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace lox {
namespace lex {

enum class TokenType : uint8_t
{
    // Single-character tokens.
    LeftParen, RightParen, LeftBrace, RightBrace,
    Comma, Dot, Minus, Plus, Semicolon, Slash, Star,

    // One or two character tokens.
    Bang, BangEqual, Equal, EqualEqual,
    Greater, GreaterEqual, Less, LessEqual,

    // Literals.
    Identifier, String, Number,

    // Keywords.
    And, Class, Else, False, Fun, For, If, Nil, Or,
    Print, Return, Super, This, True, Var, While,

    Eof
};

// Decoded value of a literal-bearing token. Empty for everything else.
using Literal = std::variant<std::monostate, double, std::string>;

struct Token
{
    TokenType type;
    std::string lexeme;
    Literal literal;
    size_t line;

    Token(TokenType t, std::string lex, Literal lit, size_t l)
        : type(t), lexeme(std::move(lex)), literal(std::move(lit)), line(l) {}
};

static const std::unordered_map<std::string_view, TokenType> token_keywords = {
    {"and",    TokenType::And},    {"class",  TokenType::Class},
    {"else",   TokenType::Else},   {"false",  TokenType::False},
    {"for",    TokenType::For},    {"fun",    TokenType::Fun},
    {"if",     TokenType::If},     {"nil",    TokenType::Nil},
    {"or",     TokenType::Or},     {"print",  TokenType::Print},
    {"return", TokenType::Return}, {"super",  TokenType::Super},
    {"this",   TokenType::This},   {"true",   TokenType::True},
    {"var",    TokenType::Var},    {"while",  TokenType::While}
};

inline std::string token_type_to_string(TokenType type)
{
    switch (type)
    {
        case TokenType::LeftParen:    return "left_paren";
        case TokenType::RightParen:   return "right_paren";
        case TokenType::LeftBrace:    return "left_brace";
        case TokenType::RightBrace:   return "right_brace";
        case TokenType::Comma:        return "comma";
        case TokenType::Dot:          return "dot";
        case TokenType::Minus:        return "minus";
        case TokenType::Plus:         return "plus";
        case TokenType::Semicolon:    return "semicolon";
        case TokenType::Slash:        return "slash";
        case TokenType::Star:         return "star";

        case TokenType::Bang:         return "bang";
        case TokenType::BangEqual:    return "bang_equal";
        case TokenType::Equal:        return "equal";
        case TokenType::EqualEqual:   return "equal_equal";
        case TokenType::Greater:      return "greater";
        case TokenType::GreaterEqual: return "greater_equal";
        case TokenType::Less:         return "less";
        case TokenType::LessEqual:    return "less_equal";

        case TokenType::Identifier:   return "identifier";
        case TokenType::String:       return "string";
        case TokenType::Number:       return "number";

        case TokenType::And:          return "and";
        case TokenType::Class:        return "class";
        case TokenType::Else:         return "else";
        case TokenType::False:        return "false";
        case TokenType::Fun:          return "fun";
        case TokenType::For:          return "for";
        case TokenType::If:           return "if";
        case TokenType::Nil:          return "nil";
        case TokenType::Or:           return "or";
        case TokenType::Print:        return "print";
        case TokenType::Return:       return "return";
        case TokenType::Super:        return "super";
        case TokenType::This:         return "this";
        case TokenType::True:         return "true";
        case TokenType::Var:          return "var";
        case TokenType::While:        return "while";
        case TokenType::Eof:          return "eof";
    }
    return "unknown";
}

// "<type> <lexeme> <literal>", one token per line in --tokens dumps.
std::string token_to_string(const Token &token);

} // namespace lex
} // namespace lox
