#include <iostream>
#include <string>

#include "error/err.hpp"
#include "session.hpp"
#include "repl.hpp"

static int usage()
{
    std::cerr << "Usage: lox [script] [--tokens] [--ast-dump] [--eval <expr>]\n";
    return lox::err::_EXIT_CODE_USAGE_;
}

int main(int argc, char *argv[])
{
    std::string filename;
    std::string expression;
    bool has_expression = false;
    lox::Session_options options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--tokens")
        {
            options.dump_tokens = true;
        }
        else if (arg == "--ast-dump")
        {
            options.dump_ast = true;
        }
        else if (arg == "--eval")
        {
            if (i + 1 >= argc || has_expression)
                return usage();
            expression = argv[++i];
            has_expression = true;
        }
        else if (arg.starts_with('-'))
        {
            std::cerr << "Unknown option: " << arg << '\n';
            return usage();
        }
        else
        {
            if (!filename.empty())
                return usage();
            filename = arg;
        }
    }

    if (has_expression && !filename.empty())
        return usage();

    lox::Session session(std::cout, std::cerr, options);

    if (has_expression)
        return session.evaluate(expression).exit_code();

    if (filename.empty())
    {
        lox::Repl repl(session);
        repl.run();
        return lox::err::_EXIT_CODE_SUCCESS_;
    }

    auto source = lox::read_source_file(filename);
    if (!source)
    {
        std::cerr << source.error().format() << '\n';
        return lox::err::_EXIT_CODE_NO_INPUT_;
    }

    return session.run(*source).exit_code();
}
