#ifndef _ERR_HPP_
#define _ERR_HPP_

#include <cstddef>
#include <string>
#include <utility>

namespace lox {
namespace err {

enum class Kind { Lexical, Syntax, Runtime, Io };

enum Exit_code
{
    _EXIT_CODE_SUCCESS_       = 0,
    _EXIT_CODE_USAGE_         = 64,
    _EXIT_CODE_ERROR_         = 65,
    _EXIT_CODE_NO_INPUT_      = 66,
    _EXIT_CODE_RUNTIME_ERROR_ = 70
};

struct msg
{
    std::string message;
    Kind kind = Kind::Runtime;
    size_t line = 0;
    // " at end", " at '<lexeme>'" or empty. Only meaningful for static errors.
    std::string where = "";

    msg() : message("") {}

    msg(std::string msg_, Kind k, size_t l = 0, std::string where_ = "")
        : message(std::move(msg_)), kind(k), line(l), where(std::move(where_))
    {
    }

    bool is_static() const { return kind == Kind::Lexical || kind == Kind::Syntax; }

    std::string format() const
    {
        if (is_static())
            return "[line " + std::to_string(line) + "] Error" + where + ": " + message;
        if (kind == Kind::Io)
            return "Error: " + message;
        return message + "\n[line " + std::to_string(line) + "]";
    }
};

} // namespace err
} // namespace lox

#endif // _ERR_HPP_
