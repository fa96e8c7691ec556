#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "./err.hpp"
#include "../lexer/token.hpp"

namespace lox::err {

// Location hint for a diagnostic raised at `token`.
std::string where_of(const lex::Token &token);

/**
 * @brief Collects and prints the diagnostics of one run.
 *
 * The lexer and parser report static errors here as they find them; the
 * session forwards the interpreter's runtime error. The flags are read back
 * through the run result, so a fresh reporter per run is all the error state
 * there is.
 */
class Reporter
{
public:
    explicit Reporter(std::ostream &out) : out_(out) {}

    void error(size_t line, const std::string &message);
    void error(const lex::Token &token, const std::string &message);
    void report(const msg &diagnostic);

    bool had_error() const { return had_error_; }
    bool had_runtime_error() const { return had_runtime_error_; }
    const std::vector<msg> &diagnostics() const { return diagnostics_; }

private:
    std::ostream &out_;
    bool had_error_ = false;
    bool had_runtime_error_ = false;
    std::vector<msg> diagnostics_;
};

} // namespace lox::err
