#include <string_view>
#include <utility>
#include <variant>

#include "interpreter.hpp"

#include <error/error.hpp>
#include <eval/environment.hpp>
#include <eval/evaluator.hpp>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

auto parse_statement(std::string_view input, std::string_view filename) -> parse_result
{
    auto env = environment {};
    auto prsr = parser {lexer {input, filename}, env};
    auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        return prsr.errors().front();
    }
    return parsed_statement {.prgrm = std::move(prgrm), .env = std::move(env)};
}

auto interpret(std::string_view input, std::string_view filename) -> run_result
{
    auto parsed = parse_statement(input, filename);
    if (auto* err = std::get_if<error>(&parsed)) {
        return std::move(*err);
    }
    auto& [prgrm, env] = std::get<parsed_statement>(parsed);
    const auto result = evaluator {env}.evaluate(*prgrm->expr);
    if (const auto* err = std::get_if<eval_error>(&result)) {
        return error {*err};
    }
    return run_output {.value = std::get<bool>(result), .prgrm = std::move(prgrm), .env = std::move(env)};
}
