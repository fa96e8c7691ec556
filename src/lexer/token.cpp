#include "token.hpp"

#include "../utility/utility.hpp"

namespace lox::lex {

std::string token_to_string(const Token &token)
{
    std::string out = token_type_to_string(token.type) + " " + token.lexeme;
    if (const double *number = std::get_if<double>(&token.literal))
        out += " " + util::number_to_string(*number);
    else if (const std::string *text = std::get_if<std::string>(&token.literal))
        out += " " + *text;
    return out;
}

} // namespace lox::lex
