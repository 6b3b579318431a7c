#include <cctype>
#include <ostream>
#include <stdexcept>
#include <string_view>
#include <variant>

#include "error.hpp"

#include <ast/expression.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <lexer/location.hpp>
#include <overloaded.hpp>

auto operator<<(std::ostream& ostream, const lex_error& err) -> std::ostream&
{
    const auto byte = static_cast<unsigned char>(err.unexpected);
    // non-printable and non-ASCII bytes are escaped
    if (byte > '~' || std::isprint(byte) == 0) {
        return ostream << fmt::format("unexpected character '\\x{:02X}'", static_cast<unsigned>(byte));
    }
    return ostream << "unexpected character '" << err.unexpected << "'";
}

auto operator<<(std::ostream& ostream, const parse_error& err) -> std::ostream&
{
    using enum parse_error::error_kind;
    switch (err.kind) {
        case unexpected_token:
            return ostream << fmt::format(
                       "expected next token to be {}, got {} instead", fmt::join(err.expected, " or "), err.found);
        case empty_program:
            return ostream << "expected an expression, got eof instead";
        case duplicate_assignment:
            return ostream << "variable " << err.name << " is already assigned";
        case nesting_too_deep:
            return ostream << "expression nests deeper than " << max_expression_depth << " levels";
    }
    throw std::invalid_argument("invalid parse_error kind");
}

auto operator<<(std::ostream& ostream, const eval_error& err) -> std::ostream&
{
    switch (err.kind) {
        case eval_error::error_kind::unbound_variable:
            return ostream << "identifier not found: " << err.name;
    }
    throw std::invalid_argument("invalid eval_error kind");
}

auto operator<<(std::ostream& ostream, const error& err) -> std::ostream&
{
    ostream << error_location(err) << ": " << error_stage(err) << " error: ";
    std::visit([&ostream](const auto& stage_error) { ostream << stage_error; }, err);
    return ostream;
}

auto error_stage(const error& err) -> std::string_view
{
    return std::visit(overloaded {
                          [](const lex_error&) -> std::string_view { return "lexer"; },
                          [](const parse_error&) -> std::string_view { return "parser"; },
                          [](const eval_error&) -> std::string_view { return "evaluation"; },
                      },
                      err);
}

auto error_location(const error& err) -> location
{
    return std::visit([](const auto& stage_error) { return stage_error.loc; }, err);
}
