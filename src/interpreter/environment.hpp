#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../value/value.hpp"
#include "../lexer/token.hpp"
#include "../error/result.hpp"

namespace lox {

using Env_handle = std::size_t;

/**
 * @brief Every live scope of one interpreter, stored by handle.
 *
 * Handle 0 is the global scope and is never popped. Block scopes are pushed
 * on entry and popped on exit in strict LIFO order, so a handle stays valid
 * exactly as long as the block that created it.
 */
class Environment
{
private:
    struct Scope
    {
        std::unordered_map<std::string, Value> values;
        std::optional<Env_handle> enclosing;
    };

    std::vector<Scope> scopes;

    Scope *find_binding(Env_handle handle, const std::string &name);

public:
    Environment() { scopes.push_back(Scope{}); }

    Env_handle global() const { return 0; }
    Env_handle push(Env_handle enclosing);
    // Discards `handle` and anything pushed after it. The global scope stays.
    void pop(Env_handle handle);

    // Redeclaring a name in the same scope overwrites it.
    void define(Env_handle handle, const std::string &name, Value value);
    Result<Value> get(Env_handle handle, const lex::Token &name) const;
    Result<void> assign(Env_handle handle, const lex::Token &name, Value value);

    // Drops every binding and every block scope.
    void clear();

    std::size_t depth() const { return scopes.size(); }
    bool contains(Env_handle handle, const std::string &name) const
    {
        return handle < scopes.size() && scopes[handle].values.contains(name);
    }
};

} // namespace lox
