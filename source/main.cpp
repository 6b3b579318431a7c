#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

#include <ast/expression.hpp>
#include <error/error.hpp>
#include <eval/evaluator.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <graph/dot.hpp>
#include <interpreter.hpp>
#include <lexer/lexer.hpp>
#include <lexer/location.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

namespace
{
struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view graph;
    std::string_view file;
};

auto show_error(std::string_view error_kind, std::string_view error_message)
{
    fmt::print(stderr, "{} error: {}\n", error_kind, error_message);
}

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print("Error: {}\n", error_msg);
        exit_code = EXIT_FAILURE;
    }
    fmt::print("Usage: {} [-d] [-g <dot-file>] [-h] [<file>]\n\n", program);
    fmt::print("  -d             print tokens, the parsed program and the variable bindings\n");
    fmt::print("  -g <dot-file>  write the syntax tree as a Graphviz graph to <dot-file>\n");
    fmt::print("  -h             show this help\n");
    fmt::print("Reads the statement from <file>, or from stdin when no file is given.\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto parse_command_line(std::string_view program, int argc, char** argv) -> command_line_args
{
    command_line_args opts {};
    const auto args = std::span(argv, static_cast<size_t>(argc));
    for (size_t idx = 0; idx < args.size(); ++idx) {
        const std::string_view arg = args[idx];
        if (arg[0] == '-' && arg.size() == 1) {
            show_usage(program, fmt::format("invalid option {}", arg));
        }
        if (arg[0] == '-' && arg.size() > 1) {
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                case 'g':
                    if (idx + 1 >= args.size()) {
                        show_usage(program, "option -g requires a file name");
                    }
                    opts.graph = args[++idx];
                    break;
                default: {
                    show_usage(program, fmt::format("invalid option {}", arg));
                }
            }
        } else {
            if (opts.file.empty()) {
                opts.file = arg;
            } else {
                fmt::print("ignoring file argument {}, already have one set.\n", arg);
            }
        }
    }
    return opts;
}

auto read_input(const command_line_args& opts) -> std::optional<std::string>
{
    if (opts.file.empty()) {
        return std::string {(std::istreambuf_iterator<char>(std::cin)), (std::istreambuf_iterator<char>())};
    }
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        show_error("io", fmt::format("could not open file: {}", opts.file));
        return std::nullopt;
    }
    return std::string {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
}

void debug_tokens(std::string_view contents, std::string_view filename)
{
    fmt::print("Tokens:\n");
    auto lxr = lexer {contents, filename};
    for (auto tok = lxr.next_token(); tok.type != token_type::eof; tok = lxr.next_token()) {
        fmt::print("  {}\n", tok);
        if (tok.type == token_type::illegal) {
            break;
        }
    }
}

auto write_graph(const command_line_args& opts, const expression& root) -> bool
{
    std::ofstream ofs(std::string {opts.graph});
    if (!ofs) {
        show_error("io", fmt::format("could not open file for writing: {}", opts.graph));
        return false;
    }
    write_dot(root, ofs);
    return true;
}

auto run(const command_line_args& opts) -> int
{
    const auto contents = read_input(opts);
    if (!contents) {
        return 1;
    }
    const auto filename = opts.file.empty() ? stdin_filename : opts.file;
    if (opts.debug) {
        debug_tokens(*contents, filename);
    }

    const auto parsed = parse_statement(*contents, filename);
    if (const auto* err = std::get_if<error>(&parsed)) {
        fmt::print(stderr, "{}\n", fmt::streamed(*err));
        return 1;
    }
    const auto& [prgrm, env] = std::get<parsed_statement>(parsed);
    if (opts.debug) {
        fmt::print("Program:\n{}\n", prgrm->string());
        fmt::print("Bindings:\n");
        env.debug();
    }
    // the graph only needs the tree, it is written even if evaluation fails
    if (!opts.graph.empty() && !write_graph(opts, *prgrm->expr)) {
        return 1;
    }

    const auto result = evaluator {env}.evaluate(*prgrm->expr);
    if (const auto* err = std::get_if<eval_error>(&result)) {
        fmt::print(stderr, "{}\n", fmt::streamed(error {*err}));
        return 1;
    }
    fmt::print("{}\n", std::get<bool>(result) ? 1 : 0);
    return 0;
}
}  // namespace

auto main(int argc, char* argv[]) -> int
{
    auto program = std::string_view(*argv);
    auto opts = parse_command_line(program, argc - 1, ++argv);
    if (opts.help) {
        show_usage(program);
    }
    try {
        return run(opts);
    } catch (const std::exception& e) {
        show_error("internal", e.what());
        return 1;
    }
}
