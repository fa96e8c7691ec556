#include "interpreter.hpp"
#include "../error/err.hpp"
#include "../utility/utility.hpp"
#include "../utility/try_res.hpp"

#include <expected>
#include <variant>

// RAII guard to restore the environment automatically after scope exits
template <typename F>
struct Finally
{
    F func;
    ~Finally() { func(); }
};

template <typename F>
Finally<F> finally(F func)
{
    return {func};
}

namespace lox
{

static err::msg runtime_error(const std::string &message) { return err::msg(message, err::Kind::Runtime); }

Interpreter::Interpreter(std::ostream &output) : current(environment.global()), out(output) {}

Result<void> Interpreter::interpret(const std::vector<ast::Stmt*> &statements)
{
    for (const auto &statement : statements)
        __TryVoid(execute(*statement));
    return {};
}

Result<std::string> Interpreter::evaluate_to_string(const ast::Expr &expr)
{
    auto value = __Try(evaluate(expr));
    return value_to_string(value);
}

void Interpreter::reset()
{
    environment.clear();
    current = environment.global();
}

Result<Value> Interpreter::evaluate(const ast::Expr &expr)
{
    return std::visit([this](const auto &node) { return evaluate_visitor(node); }, expr.node);
}

Result<void> Interpreter::execute(const ast::Stmt &stmt)
{
    return std::visit([this](const auto &node) { return execute_visitor(node); }, stmt.node);
}

Result<Value> Interpreter::evaluate_visitor(const ast::Literal_expr &expr) { return expr.value; }

Result<Value> Interpreter::evaluate_visitor(const ast::Grouping_expr &expr) { return evaluate(*expr.expression); }

Result<Value> Interpreter::evaluate_visitor(const ast::Variable_expr &expr) { return environment.get(current, expr.name); }

Result<Value> Interpreter::evaluate_visitor(const ast::Assign_expr &expr)
{
    auto value_result = __Try(evaluate(*expr.value));
    __TryVoid(environment.assign(current, expr.name, value_result));

    return value_result;
}

Result<Value> Interpreter::evaluate_visitor(const ast::Unary_expr &expr)
{
    auto right = __Try(evaluate(*expr.right));

    switch (expr.op.type)
    {
        case lex::TokenType::Bang:
            return Value(!is_truthy(right));
        case lex::TokenType::Minus:
        {
            auto res = negate(right);
            if (!res.has_value())
                res.error().line = expr.op.line;
            return res;
        }
        default:
            return std::unexpected(err::msg("Unknown unary operator " + util::operator_token_to_string(expr.op.type),
                                            err::Kind::Runtime, expr.op.line));
    }
}

Result<Value> Interpreter::evaluate_visitor(const ast::Binary_expr &expr)
{
    auto left_result = __Try(evaluate(*expr.left));
    auto right_result = __Try(evaluate(*expr.right));

    const auto &left = left_result;
    const auto &right = right_result;
    Result<Value> res;
    switch (expr.op.type)
    {
        case lex::TokenType::Plus:
            res = add(left, right); break;
        case lex::TokenType::Minus:
            res = subtract(left, right); break;
        case lex::TokenType::Star:
            res = multiply(left, right); break;
        case lex::TokenType::Slash:
            res = divide(left, right); break;
        case lex::TokenType::EqualEqual:
            res = Value(left == right); break;
        case lex::TokenType::BangEqual:
            res = Value(!(left == right)); break;
        case lex::TokenType::Less:
            res = less_than(left, right); break;
        case lex::TokenType::LessEqual:
            res = less_than_or_equal(left, right); break;
        case lex::TokenType::Greater:
            res = greater_than(left, right); break;
        case lex::TokenType::GreaterEqual:
            res = greater_than_or_equal(left, right); break;
        default:
            return std::unexpected(err::msg("Unknown binary operator " + util::operator_token_to_string(expr.op.type),
                                            err::Kind::Runtime, expr.op.line));
    }
    if (!res.has_value())
        res.error().line = expr.op.line;
    return res;
}

// The operand that decides the result is the result; the right side only runs when needed.
Result<Value> Interpreter::evaluate_visitor(const ast::Logical_expr &expr)
{
    auto left = __Try(evaluate(*expr.left));

    if (expr.op.type == lex::TokenType::Or)
    {
        if (is_truthy(left))
            return left;
    }
    else if (!is_truthy(left))
        return left;

    return evaluate(*expr.right);
}

Result<void> Interpreter::execute_visitor(const ast::Expr_stmt &stmt)
{
    __TryVoid(evaluate(*stmt.expression));
    return {};
}

Result<void> Interpreter::execute_visitor(const ast::Print_stmt &stmt)
{
    auto value = __Try(evaluate(*stmt.expression));
    out << value_to_string(value) << '\n';
    return {};
}

Result<void> Interpreter::execute_visitor(const ast::Var_stmt &stmt)
{
    Value value = std::monostate{};
    if (stmt.initializer)
        value = __Try(evaluate(*stmt.initializer));

    environment.define(current, stmt.name.lexeme, std::move(value));
    return {};
}

Result<void> Interpreter::execute_visitor(const ast::Block_stmt &stmt)
{
    return execute_block(stmt.statements, environment.push(current));
}

Result<void> Interpreter::execute_visitor(const ast::If_stmt &stmt)
{
    auto condition = __Try(evaluate(*stmt.condition));

    if (is_truthy(condition))
        return execute(*stmt.then_branch);
    if (stmt.else_branch)
        return execute(*stmt.else_branch);
    return {};
}

Result<void> Interpreter::execute_visitor(const ast::While_stmt &stmt)
{
    while (true)
    {
        auto condition = __Try(evaluate(*stmt.condition));
        if (!is_truthy(condition))
            break;
        __TryVoid(execute(*stmt.body));
    }
    return {};
}

Result<void> Interpreter::execute_block(const std::vector<ast::Stmt*> &statements, Env_handle block_env)
{
    auto previous = this->current;
    this->current = block_env;
    auto guard = finally([this, previous, block_env]() {
        this->environment.pop(block_env);
        this->current = previous;
    });

    for (const auto &statement : statements)
        __TryVoid(execute(*statement));
    return {};
}

Result<Value> Interpreter::add(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) + get_number(r));
    if (is_string(l) || is_string(r))
        return Value(value_to_string(l) + value_to_string(r));
    return std::unexpected(runtime_error("Operands must be two numbers or there must be a string."));
}

Result<Value> Interpreter::subtract(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) - get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

Result<Value> Interpreter::multiply(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) * get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

Result<Value> Interpreter::divide(const Value &l, const Value &r)
{
    if (!is_number(l) || !is_number(r))
        return std::unexpected(runtime_error("Operands must be numbers."));
    if (get_number(r) == 0.0)
        return std::unexpected(runtime_error("Division by zero."));
    return Value(get_number(l) / get_number(r));
}

Result<Value> Interpreter::negate(const Value &v)
{
    if (is_number(v))
        return Value(-get_number(v));
    return std::unexpected(runtime_error("Operand must be a number."));
}

Result<Value> Interpreter::less_than(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) < get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

Result<Value> Interpreter::less_than_or_equal(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) <= get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

Result<Value> Interpreter::greater_than(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) > get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

Result<Value> Interpreter::greater_than_or_equal(const Value &l, const Value &r)
{
    if (is_number(l) && is_number(r))
        return Value(get_number(l) >= get_number(r));
    return std::unexpected(runtime_error("Operands must be numbers."));
}

}  // namespace lox
