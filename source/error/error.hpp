#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/ostream.h>
#include <lexer/location.hpp>
#include <lexer/token_type.hpp>

struct lex_error final
{
    location loc;
    char unexpected {};
    auto operator==(const lex_error& other) const -> bool = default;
};

struct parse_error final
{
    enum class error_kind : std::uint8_t
    {
        unexpected_token,
        empty_program,
        duplicate_assignment,
        nesting_too_deep,
    };

    error_kind kind {};
    std::vector<token_type> expected;
    token_type found {};
    std::string name;
    location loc;
    auto operator==(const parse_error& other) const -> bool = default;
};

struct eval_error final
{
    enum class error_kind : std::uint8_t
    {
        unbound_variable,
    };

    error_kind kind {};
    std::string name;
    location loc;
    auto operator==(const eval_error& other) const -> bool = default;
};

using error = std::variant<lex_error, parse_error, eval_error>;

auto operator<<(std::ostream& ostream, const lex_error& err) -> std::ostream&;
auto operator<<(std::ostream& ostream, const parse_error& err) -> std::ostream&;
auto operator<<(std::ostream& ostream, const eval_error& err) -> std::ostream&;

/// Writes `file:line:column: <stage> error: <message>`.
auto operator<<(std::ostream& ostream, const error& err) -> std::ostream&;

/// Name of the pipeline stage that produced the error: lexer, parser or evaluation.
[[nodiscard]] auto error_stage(const error& err) -> std::string_view;
[[nodiscard]] auto error_location(const error& err) -> location;

template<>
struct fmt::formatter<lex_error> : ostream_formatter
{
};

template<>
struct fmt::formatter<parse_error> : ostream_formatter
{
};

template<>
struct fmt::formatter<eval_error> : ostream_formatter
{
};
