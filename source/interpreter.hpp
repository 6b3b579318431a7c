#pragma once

#include <string_view>
#include <variant>

#include <ast/program.hpp>
#include <error/error.hpp>
#include <eval/environment.hpp>
#include <lexer/location.hpp>

/// A statement that lexed and parsed cleanly, with the bindings its
/// assignments introduced. Nothing has been evaluated yet.
struct parsed_statement
{
    program_ptr prgrm;
    environment env;
};

using parse_result = std::variant<parsed_statement, error>;

struct run_output
{
    bool value {};
    program_ptr prgrm;
    environment env;
};

using run_result = std::variant<run_output, error>;

/// Lexes and parses `input`, returning the first lexical or syntax error.
auto parse_statement(std::string_view input, std::string_view filename = stdin_filename) -> parse_result;

/// Lexes, parses and evaluates `input` in one go. Either the truth value of
/// the final expression or the error of the first stage that failed is
/// returned, never both. `input` and `filename` must outlive the result.
auto interpret(std::string_view input, std::string_view filename = stdin_filename) -> run_result;
