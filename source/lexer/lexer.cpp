#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <limits>
#include <string_view>
#include <utility>

#include "lexer.hpp"

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['\n'] = newline;
    arr['^'] = caret;
    arr['('] = lparen;
    arr[')'] = rparen;
    arr['~'] = tilde;
    arr['0'] = zero;
    arr['1'] = one;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();

using text_pair = std::pair<std::string_view, token_type>;

// longest spelling first, "<=>" must win over a partial "=>" match
constexpr auto operator_tokens = std::array {
    text_pair {"<=>", token_type::iff},
    text_pair {"=>", token_type::implies},
    text_pair {":=", token_type::assign},
};

constexpr auto keyword_tokens = std::array {
    text_pair {"v", token_type::vee},
};

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
    read_char();
}

auto lexer::next_token() -> token
{
    using enum token_type;
    skip_whitespace();
    const auto loc = current_loc();
    if (m_position >= m_input.size()) {
        return token {.type = eof, .literal = "", .loc = loc};
    }
    const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
    if (char_token_type != illegal) {
        const auto literal = m_input.substr(m_position, 1);
        return read_char(), token {.type = char_token_type, .literal = literal, .loc = loc};
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    return read_operator();
}

auto lexer::read_char() -> void
{
    if (m_byte == '\n') {
        m_line++;
        m_bol = m_read_position;
    }
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace() -> void
{
    while (m_byte == ' ' || m_byte == '\t' || m_byte == '\r') {
        read_char();
    }
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_letter(m_byte)) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .literal = itr->first, .loc = loc};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .literal = identifier_or_keyword, .loc = loc};
}

auto lexer::read_operator() -> token
{
    const auto loc = current_loc();
    const auto rest = m_input.substr(m_position);
    for (const auto& [spelling, type] : operator_tokens) {
        if (rest.starts_with(spelling)) {
            for (std::size_t i = 0; i < spelling.size(); ++i) {
                read_char();
            }
            return token {.type = type, .literal = spelling, .loc = loc};
        }
    }
    const auto literal = m_input.substr(m_position, 1);
    return read_char(), token {.type = token_type::illegal, .literal = literal, .loc = loc};
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_line + 1, .column = m_position - m_bol + 1};
}
