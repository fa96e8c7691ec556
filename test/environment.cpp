#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>

#include "../src/interpreter/environment.hpp"

using lox::Environment;
using lox::Value;

static lox::lex::Token name(const std::string &lexeme, size_t line = 1)
{
    return lox::lex::Token(lox::lex::TokenType::Identifier, lexeme, std::monostate{}, line);
}

// ------------------------------
// Test cases
// ------------------------------

void test_define_and_get()
{
    std::cout << "\n--- test_define_and_get ---\n";
    Environment env;
    env.define(env.global(), "a", Value(1.0));

    auto a = env.get(env.global(), name("a"));
    assert(a.has_value());
    assert(*a == Value(1.0));

    // redeclaration overwrites
    env.define(env.global(), "a", Value(std::string("two")));
    assert(*env.get(env.global(), name("a")) == Value(std::string("two")));
}

void test_undefined_variable()
{
    std::cout << "\n--- test_undefined_variable ---\n";
    Environment env;
    auto missing = env.get(env.global(), name("ghost", 7));
    assert(!missing.has_value());
    assert(missing.error().message == "Undefined variable 'ghost'.");
    assert(missing.error().line == 7);
    assert(missing.error().kind == lox::err::Kind::Runtime);

    auto assigned = env.assign(env.global(), name("ghost", 3), Value(1.0));
    assert(!assigned.has_value());
    assert(assigned.error().line == 3);
    // assignment never creates a binding
    assert(!env.contains(env.global(), "ghost"));
}

void test_shadowing_and_lookup_through_parents()
{
    std::cout << "\n--- test_shadowing_and_lookup_through_parents ---\n";
    Environment env;
    env.define(env.global(), "a", Value(1.0));
    env.define(env.global(), "b", Value(true));

    auto inner = env.push(env.global());
    env.define(inner, "a", Value(2.0));

    assert(*env.get(inner, name("a")) == Value(2.0));
    assert(*env.get(inner, name("b")) == Value(true));
    assert(*env.get(env.global(), name("a")) == Value(1.0));
}

void test_assign_mutates_nearest_binding()
{
    std::cout << "\n--- test_assign_mutates_nearest_binding ---\n";
    Environment env;
    env.define(env.global(), "a", Value(1.0));
    auto middle = env.push(env.global());
    auto inner = env.push(middle);

    assert(env.assign(inner, name("a"), Value(5.0)).has_value());
    assert(*env.get(env.global(), name("a")) == Value(5.0));
    assert(!env.contains(inner, "a"));
    assert(!env.contains(middle, "a"));
}

void test_push_pop_is_lifo()
{
    std::cout << "\n--- test_push_pop_is_lifo ---\n";
    Environment env;
    assert(env.depth() == 1);

    auto outer = env.push(env.global());
    auto inner = env.push(outer);
    assert(env.depth() == 3);

    env.pop(inner);
    assert(env.depth() == 2);
    env.pop(outer);
    assert(env.depth() == 1);

    // the global scope is never popped
    env.pop(env.global());
    assert(env.depth() == 1);
}

void test_unassigned_is_an_ordinary_value()
{
    std::cout << "\n--- test_unassigned_is_an_ordinary_value ---\n";
    Environment env;
    env.define(env.global(), "x", Value(std::monostate{}));

    auto x = env.get(env.global(), name("x"));
    assert(x.has_value());
    assert(lox::is_unassigned(*x));
    assert(env.assign(env.global(), name("x"), Value(nullptr)).has_value());
    assert(lox::is_nil(*env.get(env.global(), name("x"))));
}

void test_clear()
{
    std::cout << "\n--- test_clear ---\n";
    Environment env;
    env.define(env.global(), "a", Value(1.0));
    env.push(env.global());
    env.clear();

    assert(env.depth() == 1);
    assert(!env.get(env.global(), name("a")).has_value());
}

int main()
{
    test_define_and_get();
    test_undefined_variable();
    test_shadowing_and_lookup_through_parents();
    test_assign_mutates_nearest_binding();
    test_push_pop_is_lifo();
    test_unassigned_is_an_ordinary_value();
    test_clear();

    std::cout << "\nAll tests passed!\n";
}
