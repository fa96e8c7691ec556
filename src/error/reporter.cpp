#include "reporter.hpp"

namespace lox::err {

std::string where_of(const lex::Token &token)
{
    if (token.type == lex::TokenType::Eof)
        return " at end";
    return " at '" + token.lexeme + "'";
}

void Reporter::error(size_t line, const std::string &message)
{
    report(msg(message, Kind::Lexical, line));
}

void Reporter::error(const lex::Token &token, const std::string &message)
{
    report(msg(message, Kind::Syntax, token.line, where_of(token)));
}

void Reporter::report(const msg &diagnostic)
{
    out_ << diagnostic.format() << '\n';
    if (diagnostic.is_static())
        had_error_ = true;
    else if (diagnostic.kind == Kind::Runtime)
        had_runtime_error_ = true;
    diagnostics_.push_back(diagnostic);
}

} // namespace lox::err
