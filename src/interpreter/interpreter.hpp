#pragma once

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

#include "../parser/ast.hpp"
#include "../value/value.hpp"
#include "../error/result.hpp"
#include "./environment.hpp"

namespace lox
{

class Interpreter
{
private:
    // Environment management
    Environment environment;
    Env_handle current;
    std::ostream &out;

public:
    // ========================================================================
    // Constructor & Public Interface
    // ========================================================================
    explicit Interpreter(std::ostream &output = std::cout);

    // Runs statements in order and stops at the first runtime error. Side
    // effects of the statements before it are kept.
    Result<void> interpret(const std::vector<ast::Stmt*> &statements);
    Result<std::string> evaluate_to_string(const ast::Expr &expr);

    // Forgets every global binding.
    void reset();

    const Environment &scopes() const { return environment; }
    Env_handle current_scope() const { return current; }

private:
    // ========================================================================
    // Expression Evaluation
    // ========================================================================
    Result<Value> evaluate(const ast::Expr &expr);
    Result<Value> evaluate_visitor(const ast::Literal_expr &expr);
    Result<Value> evaluate_visitor(const ast::Variable_expr &expr);
    Result<Value> evaluate_visitor(const ast::Assign_expr &expr);
    Result<Value> evaluate_visitor(const ast::Unary_expr &expr);
    Result<Value> evaluate_visitor(const ast::Binary_expr &expr);
    Result<Value> evaluate_visitor(const ast::Logical_expr &expr);
    Result<Value> evaluate_visitor(const ast::Grouping_expr &expr);
    // ========================================================================
    // Statement Execution
    // ========================================================================
    Result<void> execute(const ast::Stmt &stmt);
    Result<void> execute_visitor(const ast::Expr_stmt &stmt);
    Result<void> execute_visitor(const ast::Print_stmt &stmt);
    Result<void> execute_visitor(const ast::Var_stmt &stmt);
    Result<void> execute_visitor(const ast::Block_stmt &stmt);
    Result<void> execute_visitor(const ast::If_stmt &stmt);
    Result<void> execute_visitor(const ast::While_stmt &stmt);

    Result<void> execute_block(const std::vector<ast::Stmt*> &statements, Env_handle block_env);
    // ========================================================================
    // Arithmetic Operations
    // ========================================================================
    Result<Value> add(const Value &l, const Value &r);
    Result<Value> subtract(const Value &l, const Value &r);
    Result<Value> multiply(const Value &l, const Value &r);
    Result<Value> divide(const Value &l, const Value &r);
    Result<Value> negate(const Value &v);
    Result<Value> less_than(const Value &l, const Value &r);
    Result<Value> less_than_or_equal(const Value &l, const Value &r);
    Result<Value> greater_than(const Value &l, const Value &r);
    Result<Value> greater_than_or_equal(const Value &l, const Value &r);
};

}  // namespace lox
