#pragma once
#include <cstddef>
#include <ostream>
#include <string_view>

#include <fmt/ostream.h>

/// Name reported for statements read from standard input.
constexpr std::string_view stdin_filename = "<stdin>";

/// Position of a token in the statement text, line and column start at 1.
struct location final
{
    std::string_view filename {stdin_filename};
    std::size_t line {1};
    std::size_t column {1};
    auto operator==(const location& other) const -> bool = default;
};

/// Writes `filename:line:column`.
auto operator<<(std::ostream& os, const location& loc) -> std::ostream&;

template<>
struct fmt::formatter<location> : ostream_formatter
{
};
