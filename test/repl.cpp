#undef NDEBUG
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "../src/repl.hpp"
#include "../src/session.hpp"

struct Transcript
{
    std::string out;
    std::string err;
};

static Transcript drive(const std::string &input)
{
    std::istringstream in(input);
    std::ostringstream out, err;
    lox::Session session(out, err);
    lox::Repl repl(session, in, out, err);
    repl.run();
    return {out.str(), err.str()};
}

static bool contains(const std::string &haystack, const std::string &needle)
{
    return haystack.find(needle) != std::string::npos;
}

// ------------------------------
// Test cases
// ------------------------------

void test_bindings_persist_across_lines()
{
    std::cout << "\n--- test_bindings_persist_across_lines ---\n";
    auto t = drive("var a = 1;\na = a + 1;\nprint a;\n");
    assert(contains(t.out, "> 2\n"));
    assert(t.err.empty());
}

void test_bad_line_does_not_end_session()
{
    std::cout << "\n--- test_bad_line_does_not_end_session ---\n";
    auto t = drive("print nope;\nprint (1;\nprint \"still here\";\n");
    assert(contains(t.err, "Undefined variable 'nope'.\n[line 1]\n"));
    assert(contains(t.err, "[line 1] Error at ';': Expect ')' after expression.\n"));
    assert(contains(t.out, "still here\n"));
}

void test_multiline_block()
{
    std::cout << "\n--- test_multiline_block ---\n";
    auto t = drive("{\nvar x = \"{\";\nprint x;\n}\nprint 2;\n");
    assert(contains(t.out, "... "));
    assert(contains(t.out, "{\n"));
    assert(contains(t.out, "2\n"));
    assert(t.err.empty());
}

void test_commands()
{
    std::cout << "\n--- test_commands ---\n";
    auto t = drive(":help\nvar a = 1;\n:reset\nprint a;\n:quit\nprint \"unreachable\";\n");
    assert(contains(t.out, "Available commands:"));
    assert(contains(t.out, "Cleared all definitions."));
    assert(contains(t.err, "Undefined variable 'a'."));
    assert(!contains(t.out, "unreachable"));
}

void test_load_file()
{
    std::cout << "\n--- test_load_file ---\n";
    const std::string path = "repl_load_test.lox";
    {
        std::ofstream file(path);
        file << "var loaded = \"from file\";\n";
    }

    auto t = drive(":load " + path + "\nprint loaded;\n:load missing_file.lox\n");
    std::remove(path.c_str());

    assert(contains(t.out, "from file\n"));
    assert(contains(t.err, "Error: Couldn't open file: missing_file.lox\n"));
    assert(!contains(t.out, "Couldn't open file"));
}

void test_braces_in_block_comments()
{
    std::cout << "\n--- test_braces_in_block_comments ---\n";
    auto t = drive("/* { */ print 1;\nprint 2;\n");
    assert(contains(t.out, "1\n"));
    assert(contains(t.out, "2\n"));
    assert(!contains(t.out, "... "));

    // an open comment continues onto the next line, nested ones included
    t = drive("/* outer /* inner */\n still comment } */ print 3;\n");
    assert(contains(t.out, "... "));
    assert(contains(t.out, "3\n"));
    assert(t.err.empty());
}

void test_directory_is_not_a_source_file()
{
    std::cout << "\n--- test_directory_is_not_a_source_file ---\n";
    auto source = lox::read_source_file(".");
    assert(!source.has_value());
    assert(source.error().format() == "Error: Couldn't open file: .");

    auto t = drive(":load .\n");
    assert(contains(t.err, "Error: Couldn't open file: .\n"));
}

int main()
{
    test_bindings_persist_across_lines();
    test_bad_line_does_not_end_session();
    test_multiline_block();
    test_commands();
    test_load_file();
    test_braces_in_block_comments();
    test_directory_is_not_a_source_file();

    std::cout << "\nAll tests passed!\n";
}
