#pragma once

#include <ostream>
#include <string>
#include <string_view>

#include "error/err.hpp"
#include "error/result.hpp"
#include "interpreter/interpreter.hpp"

namespace lox
{

struct Session_options
{
    bool dump_tokens = false;
    bool dump_ast = false;
};

// Outcome of one run. A fresh one is produced for every script, --eval or REPL input.
struct Run_result
{
    bool had_error = false;
    bool had_runtime_error = false;

    int exit_code() const
    {
        if (had_error)
            return err::_EXIT_CODE_ERROR_;
        if (had_runtime_error)
            return err::_EXIT_CODE_RUNTIME_ERROR_;
        return err::_EXIT_CODE_SUCCESS_;
    }
};

/**
 * @brief Lexer, parser and interpreter wired together.
 *
 * The interpreter, and with it the global scope, lives as long as the session,
 * so bindings made by one run are visible to the next. Everything else
 * (tokens, AST arena, error flags) belongs to a single run.
 */
class Session
{
public:
    Session(std::ostream &out, std::ostream &err, Session_options options = {});

    // Source with static errors is reported but never executed.
    Run_result run(std::string_view source);
    // Evaluates a single expression and prints its display form.
    Run_result evaluate(std::string_view source);
    void reset();

    const Interpreter &interpreter() const { return interpreter_; }

private:
    std::ostream &out_;
    std::ostream &err_;
    Session_options options_;
    Interpreter interpreter_;
};

Result<std::string> read_source_file(const std::string &path);

} // namespace lox
