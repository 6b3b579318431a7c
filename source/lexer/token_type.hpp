#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,
    newline,

    // single character tokens
    caret,
    lparen,
    one,
    rparen,
    tilde,
    zero,

    // multi character tokens
    assign,
    iff,
    implies,
    ident,

    // keywords
    vee,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
