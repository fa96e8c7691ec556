#include "session.hpp"

#include <expected>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "error/reporter.hpp"
#include "lexer/lexer.hpp"
#include "lexer/token.hpp"
#include "memory/arena.hpp"
#include "parser/ast-printer.hpp"
#include "parser/parser.hpp"

namespace lox
{

Session::Session(std::ostream &out, std::ostream &err, Session_options options)
    : out_(out), err_(err), options_(options), interpreter_(out)
{
}

Run_result Session::run(std::string_view source)
{
    err::Reporter reporter(err_);

    lex::Lexer lexer(source, reporter);
    auto tokens = lexer.tokenize();
    if (options_.dump_tokens)
        for (const auto &token : tokens) out_ << lex::token_to_string(token) << '\n';

    mem::Arena arena;
    Parser parser(std::move(tokens), arena, reporter);
    auto statements = parser.parse();
    if (options_.dump_ast)
        out_ << ast::AstPrinter().print_statements(statements);

    if (reporter.had_error())
        return {reporter.had_error(), reporter.had_runtime_error()};

    auto result = interpreter_.interpret(statements);
    if (!result)
        reporter.report(result.error());

    return {reporter.had_error(), reporter.had_runtime_error()};
}

Run_result Session::evaluate(std::string_view source)
{
    err::Reporter reporter(err_);

    lex::Lexer lexer(source, reporter);
    auto tokens = lexer.tokenize();
    if (options_.dump_tokens)
        for (const auto &token : tokens) out_ << lex::token_to_string(token) << '\n';

    mem::Arena arena;
    Parser parser(std::move(tokens), arena, reporter);
    auto expr = parser.parse_expression();
    if (!expr)
    {
        reporter.report(expr.error());
        return {reporter.had_error(), reporter.had_runtime_error()};
    }
    if (options_.dump_ast)
        out_ << ast::AstPrinter().print(**expr) << '\n';

    if (reporter.had_error())
        return {reporter.had_error(), reporter.had_runtime_error()};

    auto text = interpreter_.evaluate_to_string(**expr);
    if (!text)
        reporter.report(text.error());
    else
        out_ << *text << '\n';

    return {reporter.had_error(), reporter.had_runtime_error()};
}

void Session::reset() { interpreter_.reset(); }

Result<std::string> read_source_file(const std::string &path)
{
    // A directory opens fine on Linux but reads as nothing.
    std::error_code ec;
    if (std::filesystem::is_directory(path, ec))
        return std::unexpected(err::msg("Couldn't open file: " + path, err::Kind::Io));

    std::ifstream file(path);
    if (!file.is_open())
        return std::unexpected(err::msg("Couldn't open file: " + path, err::Kind::Io));

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace lox
