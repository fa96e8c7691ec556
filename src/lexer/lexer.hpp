#pragma once

#include "./token.hpp"
#include "../error/reporter.hpp"

#include <cstdlib>
#include <string>
#include <string_view>
#include <vector>

namespace lox {
namespace lex {

class Lexer
{
private:
    std::string_view source;
    err::Reporter &reporter;
    size_t start = 0;
    size_t current = 0;
    size_t line = 1;
    std::vector<Token> tokens;

public:
    Lexer(std::string_view src, err::Reporter &reporter_) : source(src), reporter(reporter_) {}

    // Always returns a sequence terminated by an Eof token, even after errors.
    std::vector<Token> tokenize()
    {
        while (!is_at_end())
        {
            start = current;
            scan_token();
        }
        tokens.emplace_back(TokenType::Eof, "", std::monostate{}, line);
        return std::move(tokens);
    }

private:
    bool is_at_end() const { return current >= source.length(); }
    char advance() { return source[current++]; }
    char peek() const { return is_at_end() ? '\0' : source[current]; }
    char peek_next() const { return current + 1 >= source.length() ? '\0' : source[current + 1]; }
    bool match(char expected)
    {
        if (is_at_end() || source[current] != expected)
            return false;
        current++;
        return true;
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }
    static bool is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
    static bool is_alpha_numeric(char c) { return is_alpha(c) || is_digit(c); }
    static bool is_utf8_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

    void add_token(TokenType type, Literal literal = std::monostate{})
    {
        tokens.emplace_back(type, std::string(source.substr(start, current - start)), std::move(literal), line);
    }

    void scan_token()
    {
        char c = advance();
        switch (c)
        {
            case '(': add_token(TokenType::LeftParen); break;
            case ')': add_token(TokenType::RightParen); break;
            case '{': add_token(TokenType::LeftBrace); break;
            case '}': add_token(TokenType::RightBrace); break;
            case ',': add_token(TokenType::Comma); break;
            case '.': add_token(TokenType::Dot); break;
            case '-': add_token(TokenType::Minus); break;
            case '+': add_token(TokenType::Plus); break;
            case ';': add_token(TokenType::Semicolon); break;
            case '*': add_token(TokenType::Star); break;
            case '!':
                add_token(match('=') ? TokenType::BangEqual : TokenType::Bang);
                break;
            case '=':
                add_token(match('=') ? TokenType::EqualEqual : TokenType::Equal);
                break;
            case '<':
                add_token(match('=') ? TokenType::LessEqual : TokenType::Less);
                break;
            case '>':
                add_token(match('=') ? TokenType::GreaterEqual : TokenType::Greater);
                break;
            case '/':
                if (match('/'))
                {
                    // single-line comment: the newline is left for the line counter
                    while (peek() != '\n' && !is_at_end()) advance();
                }
                else if (match('*'))
                {
                    scan_block_comment();
                }
                else
                {
                    add_token(TokenType::Slash);
                }
                break;
            case ' ':
            case '\r':
            case '\t':
                break;
            case '\n':
                line++;
                break;
            case '"':
                scan_string();
                break;
            default:
                if (is_digit(c))
                    scan_number();
                else if (is_alpha(c))
                    scan_identifier();
                else
                {
                    // One report per character: the continuation bytes of a UTF-8 sequence go with its lead byte.
                    if (static_cast<unsigned char>(c) >= 0xC0)
                        while (is_utf8_continuation(peek())) advance();
                    reporter.error(line, "Unexpected character.");
                }
                break;
        }
    }

    // Block comments nest: every "/*" needs its own "*/".
    void scan_block_comment()
    {
        int depth = 1;
        while (depth > 0)
        {
            if (is_at_end())
            {
                reporter.error(line, "A block comment was not terminated before the end of the file.");
                return;
            }

            if (peek() == '*' && peek_next() == '/')
            {
                advance();
                advance();
                depth--;
            }
            else if (peek() == '/' && peek_next() == '*')
            {
                advance();
                advance();
                depth++;
            }
            else
            {
                if (peek() == '\n')
                    line++;
                advance();
            }
        }
    }

    void scan_string()
    {
        while (peek() != '"' && !is_at_end())
        {
            if (peek() == '\n')
                line++;
            advance();
        }

        if (is_at_end())
        {
            reporter.error(line, "A string was not terminated before the end of the file.");
            return;
        }

        advance();  // closing quote
        add_token(TokenType::String, std::string(source.substr(start + 1, current - start - 2)));
    }

    void scan_number()
    {
        while (is_digit(peek())) advance();

        // A '.' only belongs to the number when a digit follows it.
        if (peek() == '.' && is_digit(peek_next()))
        {
            advance();
            while (is_digit(peek())) advance();
        }

        // strtod saturates to HUGE_VAL or 0 on overflow/underflow.
        std::string text(source.substr(start, current - start));
        add_token(TokenType::Number, std::strtod(text.c_str(), nullptr));
    }

    void scan_identifier()
    {
        while (is_alpha_numeric(peek())) advance();

        std::string_view text = source.substr(start, current - start);
        auto it = token_keywords.find(text);
        add_token(it != token_keywords.end() ? it->second : TokenType::Identifier);
    }
};

} // namespace lex
} // namespace lox
