#pragma once

#include <vector>
#include <string>
#include <initializer_list>
#include <optional>

#include "../lexer/token.hpp"
#include "../error/result.hpp"
#include "../error/err.hpp"
#include "../error/reporter.hpp"
#include "ast.hpp"
#include "../memory/arena.hpp"

namespace lox
{

class Parser
{
public:
    Parser(std::vector<lex::Token> tokens, mem::Arena &arena, err::Reporter &reporter);

    // Best effort: declarations that fail to parse are reported, skipped, and left out.
    std::vector<ast::Stmt*> parse();

    // A single expression spanning the whole token stream. The error is returned, not reported.
    Result<ast::Expr*> parse_expression();

private:
    std::vector<lex::Token> tokens_;
    mem::Arena &arena_;
    err::Reporter &reporter_;
    size_t current_ = 0;

    // --- Utility Methods ---
    const lex::Token &peek() const { return tokens_[current_]; }
    const lex::Token &previous() const { return tokens_[current_ - 1]; }
    const lex::Token &advance();
    bool match(std::initializer_list<lex::TokenType> types);
    Result<lex::Token> consume(lex::TokenType type, const std::string &message);
    bool check(lex::TokenType type) const { return !is_at_end() && peek().type == type; }
    bool is_at_end() const { return peek().type == lex::TokenType::Eof; }
    err::msg create_error(const lex::Token &token, const std::string &message) const;
    void synchronize();

    // --- Declaration Parsers ---
    std::optional<ast::Stmt*> declaration();
    Result<ast::Stmt*> var_declaration();

    // --- Statement Parsers ---
    Result<ast::Stmt*> statement();
    Result<ast::Stmt*> print_statement();
    Result<ast::Stmt*> block_statement();
    Result<ast::Stmt*> if_statement();
    Result<ast::Stmt*> while_statement();
    Result<ast::Stmt*> expression_statement();

    // --- Expression Parsers (by precedence) ---
    Result<ast::Expr*> expression();
    Result<ast::Expr*> assignment();
    Result<ast::Expr*> logical_or();
    Result<ast::Expr*> logical_and();
    Result<ast::Expr*> equality();
    Result<ast::Expr*> comparison();
    Result<ast::Expr*> term();
    Result<ast::Expr*> factor();
    Result<ast::Expr*> unary();
    Result<ast::Expr*> primary();
};

} // namespace lox
