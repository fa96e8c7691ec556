#include "ast-printer.hpp"
#include "../value/value.hpp"
#include "ast.hpp"

#include <variant>

namespace lox::ast {

// ---------- private utils ----------

std::string AstPrinter::parenthesize(const std::string &name, const std::vector<const Expr *> &parts) const
{
    std::string out = "(" + name;
    for (const Expr *part : parts)
        out += " " + print(*part);
    return out + ")";
}

// ---------- public ----------

std::string AstPrinter::print(const Expr &expr) const
{
    return std::visit([this](auto const &node) { return print_expr_node(node); }, expr.node);
}

std::string AstPrinter::print(const Stmt &stmt) const
{
    return std::visit([this](auto const &node) { return print_stmt_node(node); }, stmt.node);
}

std::string AstPrinter::print_statements(const std::vector<Stmt *> &statements) const
{
    std::string out;
    for (const Stmt *stmt : statements)
        out += print(*stmt) + "\n";
    return out;
}

// ---------- Expressions ----------

std::string AstPrinter::print_expr_node(const Literal_expr &node) const
{
    // Quoted so that `"1"` and `1` read differently in a dump.
    if (is_string(node.value))
        return "\"" + get_string(node.value) + "\"";
    return value_to_string(node.value);
}

std::string AstPrinter::print_expr_node(const Variable_expr &node) const { return node.name.lexeme; }

std::string AstPrinter::print_expr_node(const Assign_expr &node) const
{
    return "(= " + node.name.lexeme + " " + print(*node.value) + ")";
}

std::string AstPrinter::print_expr_node(const Unary_expr &node) const
{
    return parenthesize(node.op.lexeme, {node.right});
}

std::string AstPrinter::print_expr_node(const Binary_expr &node) const
{
    return parenthesize(node.op.lexeme, {node.left, node.right});
}

std::string AstPrinter::print_expr_node(const Logical_expr &node) const
{
    return parenthesize(node.op.lexeme, {node.left, node.right});
}

std::string AstPrinter::print_expr_node(const Grouping_expr &node) const
{
    return parenthesize("group", {node.expression});
}

// ---------- Statements ----------

std::string AstPrinter::print_stmt_node(const Expr_stmt &node) const { return parenthesize(";", {node.expression}); }

std::string AstPrinter::print_stmt_node(const Print_stmt &node) const { return parenthesize("print", {node.expression}); }

std::string AstPrinter::print_stmt_node(const Var_stmt &node) const
{
    if (node.initializer == nullptr)
        return "(var " + node.name.lexeme + ")";
    return "(var " + node.name.lexeme + " = " + print(*node.initializer) + ")";
}

std::string AstPrinter::print_stmt_node(const Block_stmt &node) const
{
    std::string out = "(block";
    for (const Stmt *stmt : node.statements)
        out += " " + print(*stmt);
    return out + ")";
}

std::string AstPrinter::print_stmt_node(const If_stmt &node) const
{
    if (node.else_branch == nullptr)
        return "(if " + print(*node.condition) + " " + print(*node.then_branch) + ")";
    return "(if-else " + print(*node.condition) + " " + print(*node.then_branch) + " " + print(*node.else_branch) + ")";
}

std::string AstPrinter::print_stmt_node(const While_stmt &node) const
{
    return "(while " + print(*node.condition) + " " + print(*node.body) + ")";
}

}  // namespace lox::ast
