#include "parser.hpp"

#include <string>
#include <utility>
#include <vector>
#include <variant>
#include <expected>

#include "../lexer/token.hpp"
#include "../error/err.hpp"
#include "../error/result.hpp"
#include "../utility/try_res.hpp"

namespace lox {

Parser::Parser(std::vector<lex::Token> tokens, mem::Arena &arena, err::Reporter &reporter)
    : tokens_(std::move(tokens)), arena_(arena), reporter_(reporter)
{
    if (tokens_.empty() || tokens_.back().type != lex::TokenType::Eof)
    {
        size_t line = tokens_.empty() ? 1 : tokens_.back().line;
        tokens_.emplace_back(lex::TokenType::Eof, "", std::monostate{}, line);
    }
}

std::vector<ast::Stmt*> Parser::parse()
{
    std::vector<ast::Stmt*> statements;
    while (!is_at_end())
    {
        if (auto stmt = declaration())
            statements.push_back(*stmt);
    }
    return statements;
}

Result<ast::Expr*> Parser::parse_expression()
{
    auto expr = __Try(expression());
    if (!is_at_end())
        return std::unexpected(create_error(peek(), "Expect end of expression."));
    return expr;
}

const lex::Token &Parser::advance()
{
    if (!is_at_end())
        current_++;
    return previous();
}

bool Parser::match(std::initializer_list<lex::TokenType> types)
{
    for (auto type : types)
    {
        if (check(type))
        {
            advance();
            return true;
        }
    }
    return false;
}

Result<lex::Token> Parser::consume(lex::TokenType type, const std::string &message)
{
    if (check(type))
        return advance();
    return std::unexpected(create_error(peek(), message));
}

err::msg Parser::create_error(const lex::Token &token, const std::string &message) const
{
    return err::msg(message, err::Kind::Syntax, token.line, err::where_of(token));
}

void Parser::synchronize()
{
    advance();
    while (!is_at_end())
    {
        if (previous().type == lex::TokenType::Semicolon)
            return;
        switch (peek().type)
        {
            case lex::TokenType::Class:
            case lex::TokenType::Fun:
            case lex::TokenType::Var:
            case lex::TokenType::For:
            case lex::TokenType::If:
            case lex::TokenType::While:
            case lex::TokenType::Print:
            case lex::TokenType::Return:
                return;
            default:
                advance();
        }
    }
}

// Recovery point: one report and one resync per broken declaration.
std::optional<ast::Stmt*> Parser::declaration()
{
    auto stmt = match({lex::TokenType::Var}) ? var_declaration() : statement();
    if (!stmt)
    {
        reporter_.report(stmt.error());
        synchronize();
        return std::nullopt;
    }
    return *stmt;
}

Result<ast::Stmt*> Parser::var_declaration()
{
    auto name = __Try(consume(lex::TokenType::Identifier, "Expect variable name."));

    ast::Expr* initializer = nullptr;
    if (match({lex::TokenType::Equal}))
        initializer = __Try(expression());

    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after variable declaration."));

    return mem::Arena::alloc(this->arena_, ast::Stmt {
        ast::Var_stmt {
            .name = std::move(name),
            .initializer = initializer
        }
    });
}

Result<ast::Stmt*> Parser::statement()
{
    if (match({lex::TokenType::Print}))
        return print_statement();
    if (match({lex::TokenType::LeftBrace}))
        return block_statement();
    if (match({lex::TokenType::If}))
        return if_statement();
    if (match({lex::TokenType::While}))
        return while_statement();
    return expression_statement();
}

Result<ast::Stmt*> Parser::print_statement()
{
    auto value = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after value."));

    return mem::Arena::alloc(this->arena_, ast::Stmt{ast::Print_stmt{value}});
}

Result<ast::Stmt*> Parser::block_statement()
{
    std::vector<ast::Stmt*> statements;

    // Errors inside the block are handled by declaration(), so the block keeps going.
    while (!check(lex::TokenType::RightBrace) && !is_at_end())
    {
        if (auto stmt = declaration())
            statements.push_back(*stmt);
    }

    __TryVoid(consume(lex::TokenType::RightBrace, "Expected '}' after a code block."));

    return mem::Arena::alloc(this->arena_, ast::Stmt{ast::Block_stmt{std::move(statements)}});
}

Result<ast::Stmt*> Parser::if_statement()
{
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after 'if'."));
    auto condition = __Try(expression());
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after if condition."));

    auto then_branch = __Try(statement());
    ast::Stmt* else_branch = nullptr;
    if (match({lex::TokenType::Else}))
        else_branch = __Try(statement());

    return mem::Arena::alloc(this->arena_, ast::Stmt {
        ast::If_stmt {
            .condition = condition,
            .then_branch = then_branch,
            .else_branch = else_branch
        }
    });
}

Result<ast::Stmt*> Parser::while_statement()
{
    __TryVoid(consume(lex::TokenType::LeftParen, "Expect '(' after 'while'."));
    auto condition = __Try(expression());
    __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after condition."));
    auto body = __Try(statement());

    return mem::Arena::alloc(this->arena_, ast::Stmt{ast::While_stmt{condition, body}});
}

Result<ast::Stmt*> Parser::expression_statement()
{
    auto expr = __Try(expression());
    __TryVoid(consume(lex::TokenType::Semicolon, "Expect ';' after expression."));

    return mem::Arena::alloc(this->arena_, ast::Stmt{ast::Expr_stmt{expr}});
}

Result<ast::Expr*> Parser::expression() { return assignment(); }

Result<ast::Expr*> Parser::assignment()
{
    auto expr = __Try(logical_or());

    if (match({lex::TokenType::Equal}))
    {
        lex::Token equals = previous();
        // The right side is parsed even when the target is invalid, so the
        // error does not leave the parser in the middle of an expression.
        auto value = __Try(assignment());

        if (auto *var_expr = std::get_if<ast::Variable_expr>(&expr->node))
        {
            return mem::Arena::alloc(this->arena_, ast::Expr{
                ast::Assign_expr{var_expr->name, value}});
        }

        reporter_.error(equals, "Invalid assignment target.");
    }
    return expr;
}

Result<ast::Expr*> Parser::logical_or()
{
    auto expr = __Try(logical_and());

    while (match({lex::TokenType::Or}))
    {
        lex::Token op = previous();
        auto right = __Try(logical_and());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Logical_expr{
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::logical_and()
{
    auto expr = __Try(equality());

    while (match({lex::TokenType::And}))
    {
        lex::Token op = previous();
        auto right = __Try(equality());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Logical_expr{
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::equality()
{
    auto expr = __Try(comparison());

    while (match({lex::TokenType::BangEqual, lex::TokenType::EqualEqual}))
    {
        lex::Token op = previous();
        auto right = __Try(comparison());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Binary_expr{
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::comparison()
{
    auto expr = __Try(term());

    while (match({lex::TokenType::Greater, lex::TokenType::GreaterEqual, lex::TokenType::Less, lex::TokenType::LessEqual}))
    {
        lex::Token op = previous();
        auto right = __Try(term());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Binary_expr{
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::term()
{
    auto expr = __Try(factor());

    while (match({lex::TokenType::Minus, lex::TokenType::Plus}))
    {
        lex::Token op = previous();
        auto right = __Try(factor());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Binary_expr {
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::factor()
{
    auto expr = __Try(unary());

    while (match({lex::TokenType::Slash, lex::TokenType::Star}))
    {
        lex::Token op = previous();
        auto right = __Try(unary());

        expr = mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Binary_expr {
                .left = expr,
                .op = std::move(op),
                .right = right
            }
        });
    }
    return expr;
}

Result<ast::Expr*> Parser::unary()
{
    if (match({lex::TokenType::Bang, lex::TokenType::Minus}))
    {
        lex::Token op = previous();
        auto right = __Try(unary());

        return mem::Arena::alloc(this->arena_, ast::Expr {
            ast::Unary_expr{
                .op = std::move(op),
                .right = right
            }
        });
    }
    return primary();
}

Result<ast::Expr*> Parser::primary()
{
    if (match({lex::TokenType::False}))
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Literal_expr{Value(false)}});
    if (match({lex::TokenType::True}))
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Literal_expr{Value(true)}});
    if (match({lex::TokenType::Nil}))
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Literal_expr{Value(nullptr)}});

    if (match({lex::TokenType::Number, lex::TokenType::String}))
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Literal_expr{literal_to_value(previous().literal)}});

    if (match({lex::TokenType::Identifier}))
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Variable_expr{previous()}});

    if (match({lex::TokenType::LeftParen}))
    {
        auto expr = __Try(expression());
        __TryVoid(consume(lex::TokenType::RightParen, "Expect ')' after expression."));
        return mem::Arena::alloc(this->arena_, ast::Expr{ast::Grouping_expr{expr}});
    }

    return std::unexpected(create_error(peek(), "An expression is expected here."));
}

} // namespace lox
