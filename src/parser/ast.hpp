#pragma once

#include <vector>
#include <variant>

#include "../value/value.hpp"
#include "../lexer/token.hpp"

namespace lox::ast
{

// Nodes are allocated in a mem::Arena by the parser. Child pointers are never
// shared, so every node has exactly one parent. Optional children are nullptr.
struct Expr;
struct Stmt;

// =================================
// Expression node types
// =================================
struct Literal_expr
{
    Value value;
};

struct Variable_expr
{
    lex::Token name;
};

struct Assign_expr
{
    lex::Token name;
    Expr* value;
};

struct Unary_expr
{
    lex::Token op;
    Expr* right;
};

struct Binary_expr
{
    Expr* left;
    lex::Token op;
    Expr* right;
};

// `and` / `or`: kept apart from Binary_expr because the right side is evaluated lazily.
struct Logical_expr
{
    Expr* left;
    lex::Token op;
    Expr* right;
};

struct Grouping_expr
{
    Expr* expression;
};

// =================================
// Unified expression wrapper
// =================================
struct Expr
{
    using Node = std::variant<Literal_expr, Variable_expr, Assign_expr, Unary_expr, Binary_expr, Logical_expr,
                              Grouping_expr>;

    Node node;
};

// =================================
// Statement node types
// =================================
struct Expr_stmt
{
    Expr* expression;
};

struct Print_stmt
{
    Expr* expression;
};

struct Var_stmt
{
    lex::Token name;
    Expr* initializer;
};

struct Block_stmt
{
    std::vector<Stmt*> statements;
};

struct If_stmt
{
    Expr* condition;
    Stmt* then_branch;
    Stmt* else_branch;
};

struct While_stmt
{
    Expr* condition;
    Stmt* body;
};

// =================================
// Unified statement wrapper
// =================================
struct Stmt
{
    using Node = std::variant<Expr_stmt, Print_stmt, Var_stmt, Block_stmt, If_stmt, While_stmt>;

    Node node;
};

}  // namespace lox::ast
