#undef NDEBUG
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../src/error/reporter.hpp"
#include "../src/lexer/lexer.hpp"
#include "../src/lexer/token.hpp"

using lox::lex::Lexer;
using lox::lex::Token;
using lox::lex::TokenType;

static std::vector<Token> scan(const std::string &source, lox::err::Reporter &reporter)
{
    Lexer lexer(source, reporter);
    return lexer.tokenize();
}

static std::vector<TokenType> types_of(const std::vector<Token> &tokens)
{
    std::vector<TokenType> types;
    for (const auto &token : tokens) types.push_back(token.type);
    return types;
}

// ------------------------------
// Test cases
// ------------------------------

void test_punctuation_and_operators()
{
    std::cout << "\n--- test_punctuation_and_operators ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("( ) { } , . - + ; / * ! != = == > >= < <=", reporter);
    assert(!reporter.had_error());

    std::vector<TokenType> expected = {
        TokenType::LeftParen, TokenType::RightParen, TokenType::LeftBrace, TokenType::RightBrace,
        TokenType::Comma, TokenType::Dot, TokenType::Minus, TokenType::Plus, TokenType::Semicolon,
        TokenType::Slash, TokenType::Star, TokenType::Bang, TokenType::BangEqual, TokenType::Equal,
        TokenType::EqualEqual, TokenType::Greater, TokenType::GreaterEqual, TokenType::Less,
        TokenType::LessEqual, TokenType::Eof
    };
    assert(types_of(tokens) == expected);
}

void test_keywords_and_identifiers()
{
    std::cout << "\n--- test_keywords_and_identifiers ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("var orchid = nil; while _x1 class", reporter);

    std::vector<TokenType> expected = {
        TokenType::Var, TokenType::Identifier, TokenType::Equal, TokenType::Nil, TokenType::Semicolon,
        TokenType::While, TokenType::Identifier, TokenType::Class, TokenType::Eof
    };
    assert(types_of(tokens) == expected);
    assert(tokens[1].lexeme == "orchid");
    assert(tokens[6].lexeme == "_x1");
}

void test_number_literals()
{
    std::cout << "\n--- test_number_literals ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("123 4.5 6.", reporter);

    assert(tokens.size() == 5);
    assert(tokens[0].type == TokenType::Number);
    assert(std::get<double>(tokens[0].literal) == 123.0);
    assert(std::get<double>(tokens[1].literal) == 4.5);
    // trailing dot is its own token
    assert(tokens[2].type == TokenType::Number);
    assert(tokens[2].lexeme == "6");
    assert(tokens[3].type == TokenType::Dot);
}

void test_multiline_string()
{
    std::cout << "\n--- test_multiline_string ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("\"one\ntwo\" x", reporter);

    assert(!reporter.had_error());
    assert(tokens[0].type == TokenType::String);
    assert(std::get<std::string>(tokens[0].literal) == "one\ntwo");
    assert(tokens[0].lexeme == "\"one\ntwo\"");
    assert(tokens[1].type == TokenType::Identifier);
    assert(tokens[1].line == 2);
}

void test_comments()
{
    std::cout << "\n--- test_comments ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("a // line comment\n/* outer /* inner */ still\n comment */ b", reporter);

    assert(!reporter.had_error());
    assert(tokens.size() == 3);
    assert(tokens[0].lexeme == "a");
    assert(tokens[1].lexeme == "b");
    assert(tokens[1].line == 3);
}

void test_unterminated_block_comment()
{
    std::cout << "\n--- test_unterminated_block_comment ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("/* never closed", reporter);

    assert(tokens.size() == 1);
    assert(tokens[0].type == TokenType::Eof);
    assert(reporter.diagnostics().size() == 1);
    assert(diagnostics.str() ==
           "[line 1] Error: A block comment was not terminated before the end of the file.\n");
}

void test_unterminated_string()
{
    std::cout << "\n--- test_unterminated_string ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("print \"abc\n", reporter);

    assert(tokens.size() == 2);
    assert(tokens[0].type == TokenType::Print);
    assert(tokens[1].type == TokenType::Eof);
    assert(diagnostics.str() == "[line 2] Error: A string was not terminated before the end of the file.\n");
}

void test_unexpected_characters_keep_scanning()
{
    std::cout << "\n--- test_unexpected_characters_keep_scanning ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("a @ b\n# c", reporter);

    assert(reporter.diagnostics().size() == 2);
    assert(reporter.diagnostics()[0].line == 1);
    assert(reporter.diagnostics()[1].line == 2);
    assert(types_of(tokens) == (std::vector<TokenType>{TokenType::Identifier, TokenType::Identifier,
                                                       TokenType::Identifier, TokenType::Eof}));
}

void test_multibyte_character_is_one_error()
{
    std::cout << "\n--- test_multibyte_character_is_one_error ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    // "café" and "→" are two and three bytes wide in UTF-8
    auto tokens = scan("var caf\xC3\xA9 = 1; \xE2\x86\x92", reporter);

    assert(reporter.diagnostics().size() == 2);
    assert(diagnostics.str() == "[line 1] Error: Unexpected character.\n"
                                "[line 1] Error: Unexpected character.\n");
    assert(types_of(tokens) == (std::vector<TokenType>{TokenType::Var, TokenType::Identifier, TokenType::Equal,
                                                       TokenType::Number, TokenType::Semicolon, TokenType::Eof}));
    assert(tokens[1].lexeme == "caf");
}

void test_relex_round_trip()
{
    std::cout << "\n--- test_relex_round_trip ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("var x = (1 + 2.5) * -y; if (x >= 3 and !z) print \"hi\"; else { x = nil; }", reporter);

    std::string joined;
    for (const auto &token : tokens)
    {
        if (token.type == TokenType::Eof)
            break;
        joined += token.lexeme + " ";
    }

    auto again = scan(joined, reporter);
    assert(!reporter.had_error());
    assert(again.size() == tokens.size());
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        assert(again[i].type == tokens[i].type);
        assert(again[i].lexeme == tokens[i].lexeme);
    }
}

void test_token_to_string()
{
    std::cout << "\n--- test_token_to_string ---\n";
    std::ostringstream diagnostics;
    lox::err::Reporter reporter(diagnostics);
    auto tokens = scan("12 \"s\" name", reporter);

    assert(lox::lex::token_to_string(tokens[0]) == "number 12 12");
    assert(lox::lex::token_to_string(tokens[1]) == "string \"s\" s");
    assert(lox::lex::token_to_string(tokens[2]) == "identifier name");
    assert(lox::lex::token_to_string(tokens[3]) == "eof ");
}

int main()
{
    test_punctuation_and_operators();
    test_keywords_and_identifiers();
    test_number_literals();
    test_multiline_string();
    test_comments();
    test_unterminated_block_comment();
    test_unterminated_string();
    test_unexpected_characters_keep_scanning();
    test_multibyte_character_is_one_error();
    test_relex_round_trip();
    test_token_to_string();

    std::cout << "\nAll tests passed!\n";
}
