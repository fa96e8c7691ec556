#include "environment.hpp"

#include <expected>
#include <utility>

#include "../error/err.hpp"

namespace lox {

static err::msg undefined_variable(const lex::Token &name)
{
    return err::msg("Undefined variable '" + name.lexeme + "'.", err::Kind::Runtime, name.line);
}

Env_handle Environment::push(Env_handle enclosing)
{
    scopes.push_back(Scope{{}, enclosing});
    return scopes.size() - 1;
}

void Environment::pop(Env_handle handle)
{
    if (handle == global() || handle >= scopes.size())
        return;
    scopes.resize(handle);
}

void Environment::define(Env_handle handle, const std::string &name, Value value)
{
    scopes[handle].values[name] = std::move(value);
}

Environment::Scope *Environment::find_binding(Env_handle handle, const std::string &name)
{
    std::optional<Env_handle> cursor = handle;
    while (cursor)
    {
        Scope &scope = scopes[*cursor];
        if (scope.values.contains(name))
            return &scope;
        cursor = scope.enclosing;
    }
    return nullptr;
}

Result<Value> Environment::get(Env_handle handle, const lex::Token &name) const
{
    std::optional<Env_handle> cursor = handle;
    while (cursor)
    {
        const Scope &scope = scopes[*cursor];
        if (auto it = scope.values.find(name.lexeme); it != scope.values.end())
            return it->second;
        cursor = scope.enclosing;
    }
    return std::unexpected(undefined_variable(name));
}

Result<void> Environment::assign(Env_handle handle, const lex::Token &name, Value value)
{
    Scope *scope = find_binding(handle, name.lexeme);
    if (scope == nullptr)
        return std::unexpected(undefined_variable(name));

    scope->values[name.lexeme] = std::move(value);
    return {};
}

void Environment::clear()
{
    scopes.clear();
    scopes.push_back(Scope{});
}

} // namespace lox
