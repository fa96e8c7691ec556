#pragma once

#include <iostream>
#include <string>

#include "session.hpp"

namespace lox
{

class Repl
{
private:
    Session &session;
    std::istream &in;
    std::ostream &out;
    std::ostream &err;

    // Braces outside strings and comments must balance, and every block
    // comment must be closed, before an input runs.
    static bool is_complete_input(const std::string &input)
    {
        int brace_count = 0;
        bool in_string = false;
        int comment_depth = 0;

        for (size_t i = 0; i < input.size(); i++)
        {
            char c = input[i];
            char next = i + 1 < input.size() ? input[i + 1] : '\0';

            if (comment_depth > 0)
            {
                if (c == '/' && next == '*')
                {
                    comment_depth++;
                    i++;
                }
                else if (c == '*' && next == '/')
                {
                    comment_depth--;
                    i++;
                }
                continue;
            }

            if (c == '"')
            {
                in_string = !in_string;
                continue;
            }
            if (in_string)
                continue;

            if (c == '/' && next == '/')
            {
                while (i < input.size() && input[i] != '\n') i++;
                continue;
            }
            if (c == '/' && next == '*')
            {
                comment_depth = 1;
                i++;
                continue;
            }
            if (c == '{')
                brace_count++;
            else if (c == '}')
                brace_count--;
        }

        return brace_count <= 0 && !in_string && comment_depth == 0;
    }

    void print_welcome()
    {
        out << "lox REPL\n";
        out << "Type :help for commands, :quit to exit\n";
        out << "\n";
    }

    void print_help()
    {
        out << "Available commands:\n";
        out << "  :help         - Show this help message\n";
        out << "  :quit         - Exit the REPL\n";
        out << "  :reset        - Forget all global variables\n";
        out << "  :load <file>  - Run a .lox file in this session\n";
        out << "\n";
        out << "Multi-line input: while a '{' or '/*' is still open, the prompt changes to '...'\n";
        out << "and input continues on the next line.\n";
    }

    void load_file(const std::string &filename)
    {
        auto source = read_source_file(filename);
        if (!source)
        {
            err << source.error().format() << '\n';
            return;
        }
        session.run(*source);
    }

public:
    Repl(Session &session_, std::istream &in_ = std::cin, std::ostream &out_ = std::cout,
         std::ostream &err_ = std::cerr)
        : session(session_), in(in_), out(out_), err(err_)
    {
    }

    void run()
    {
        print_welcome();

        std::string input;
        std::string line;

        while (true)
        {
            // Show appropriate prompt
            if (input.empty())
                out << "> " << std::flush;
            else
                out << "... " << std::flush;

            if (!std::getline(in, line))
            {
                // EOF (Ctrl+D)
                out << '\n';
                break;
            }

            // Handle special commands
            if (input.empty())
            {
                if (line == ":quit")
                    break;
                else if (line == ":help")
                {
                    print_help();
                    continue;
                }
                else if (line == ":reset")
                {
                    session.reset();
                    out << "Cleared all definitions.\n";
                    continue;
                }
                else if (line.starts_with(":load "))
                {
                    load_file(line.substr(6));
                    continue;
                }
            }

            // Accumulate input
            if (!input.empty())
                input += "\n";
            input += line;

            // Each input gets its own run result, so an error here never ends the session.
            if (is_complete_input(input))
            {
                session.run(input);
                input.clear();
            }
        }
    }
};

} // namespace lox
