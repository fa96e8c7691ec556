#pragma once

#include <vector>
#include <string>

#include "ast.hpp"

namespace lox::ast
{

// Renders trees in prefix form, e.g. `(+ 1 (* 2 3))` or `(var a = (group 1))`.
class AstPrinter
{
public:
    std::string print(const Expr &expr) const;
    std::string print(const Stmt &stmt) const;
    // One statement per line.
    std::string print_statements(const std::vector<Stmt *> &statements) const;

private:
    // --- Expression Visitors ---
    std::string print_expr_node(const Literal_expr &node) const;
    std::string print_expr_node(const Variable_expr &node) const;
    std::string print_expr_node(const Assign_expr &node) const;
    std::string print_expr_node(const Unary_expr &node) const;
    std::string print_expr_node(const Binary_expr &node) const;
    std::string print_expr_node(const Logical_expr &node) const;
    std::string print_expr_node(const Grouping_expr &node) const;

    // --- Statement Visitors ---
    std::string print_stmt_node(const Expr_stmt &node) const;
    std::string print_stmt_node(const Print_stmt &node) const;
    std::string print_stmt_node(const Var_stmt &node) const;
    std::string print_stmt_node(const Block_stmt &node) const;
    std::string print_stmt_node(const If_stmt &node) const;
    std::string print_stmt_node(const While_stmt &node) const;

    // --- Helper Methods ---
    std::string parenthesize(const std::string &name, const std::vector<const Expr *> &parts) const;
};

}  // namespace lox::ast
