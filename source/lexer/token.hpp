#pragma once

#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

#include "location.hpp"
#include "token_type.hpp"

/// A lexeme of the statement text. `literal` views into the lexer input.
struct token final
{
    token_type type {token_type::illegal};
    std::string_view literal;
    location loc;
    auto operator==(const token& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const token& tok) -> std::ostream&;

template<>
struct fmt::formatter<token> : ostream_formatter
{
};
