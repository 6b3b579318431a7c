#include <cstddef>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <gtest/gtest.h>
#include <lexer/lexer.hpp>
#include <lexer/location.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

// NOLINTBEGIN(*-magic-numbers)
namespace
{
auto at(std::size_t line, std::size_t column) -> location
{
    return location {.filename = "<stdin>", .line = line, .column = column};
}

auto lex_all(std::string_view input) -> std::vector<token>
{
    auto lxr = lexer {input};
    auto tokens = std::vector<token> {};
    for (auto tok = lxr.next_token(); tok.type != token_type::eof; tok = lxr.next_token()) {
        tokens.push_back(tok);
    }
    return tokens;
}
}  // namespace

TEST(lexing, testNextToken)
{
    using enum token_type;
    auto lxr = lexer {R"r(p := 1
q:=0
~p v (q ^ 1) => pvq <=> 0)r"};
    const auto expected_tokens = std::vector<token> {
        token {.type = ident, .literal = "p", .loc = at(1, 1)},
        token {.type = assign, .literal = ":=", .loc = at(1, 3)},
        token {.type = one, .literal = "1", .loc = at(1, 6)},
        token {.type = newline, .literal = "\n", .loc = at(1, 7)},
        token {.type = ident, .literal = "q", .loc = at(2, 1)},
        token {.type = assign, .literal = ":=", .loc = at(2, 2)},
        token {.type = zero, .literal = "0", .loc = at(2, 4)},
        token {.type = newline, .literal = "\n", .loc = at(2, 5)},
        token {.type = tilde, .literal = "~", .loc = at(3, 1)},
        token {.type = ident, .literal = "p", .loc = at(3, 2)},
        token {.type = vee, .literal = "v", .loc = at(3, 4)},
        token {.type = lparen, .literal = "(", .loc = at(3, 6)},
        token {.type = ident, .literal = "q", .loc = at(3, 7)},
        token {.type = caret, .literal = "^", .loc = at(3, 9)},
        token {.type = one, .literal = "1", .loc = at(3, 11)},
        token {.type = rparen, .literal = ")", .loc = at(3, 12)},
        token {.type = implies, .literal = "=>", .loc = at(3, 14)},
        token {.type = ident, .literal = "pvq", .loc = at(3, 17)},
        token {.type = iff, .literal = "<=>", .loc = at(3, 21)},
        token {.type = zero, .literal = "0", .loc = at(3, 25)},
        token {.type = eof, .literal = "", .loc = at(3, 26)},
    };
    for (const auto& expected_token : expected_tokens) {
        auto token = lxr.next_token();
        ASSERT_EQ(token, expected_token);
    }
}

TEST(lexing, testEofRepeats)
{
    auto lxr = lexer {"1 "};
    ASSERT_EQ(lxr.next_token().type, token_type::one);
    const auto first_eof = lxr.next_token();
    ASSERT_EQ(first_eof, (token {.type = token_type::eof, .literal = "", .loc = at(1, 3)}));
    ASSERT_EQ(lxr.next_token(), first_eof);
}

TEST(lexing, testWhitespaceIsSkippedButNewlinesAreNot)
{
    using enum token_type;
    const auto tokens = lex_all("1\t^\r\n0");
    const auto expected = std::vector<token> {
        token {.type = one, .literal = "1", .loc = at(1, 1)},
        token {.type = caret, .literal = "^", .loc = at(1, 3)},
        token {.type = newline, .literal = "\n", .loc = at(1, 5)},
        token {.type = zero, .literal = "0", .loc = at(2, 1)},
    };
    ASSERT_EQ(tokens, expected);
}

TEST(lexing, testVeeIsOnlyAKeywordOnItsOwn)
{
    struct vee_test
    {
        std::string_view input;
        std::vector<token_type> expected;
    };
    using enum token_type;
    const auto tests = std::vector<vee_test> {
        {"v", {vee}},
        {"p v q", {ident, vee, ident}},
        {"pvq", {ident}},
        {"vv", {ident}},
        {"V", {ident}},
        {"(p)v(q)", {lparen, ident, rparen, vee, lparen, ident, rparen}},
    };
    for (const auto& [input, expected] : tests) {
        auto types = std::vector<token_type> {};
        for (const auto& tok : lex_all(input)) {
            types.push_back(tok.type);
        }
        EXPECT_EQ(types, expected) << "while lexing `" << input << "`";
    }
}

TEST(lexing, testDigitsAreSingleCharacterLiterals)
{
    using enum token_type;
    const auto tokens = lex_all("10");
    ASSERT_EQ(tokens.size(), 2U);
    EXPECT_EQ(tokens[0].type, one);
    EXPECT_EQ(tokens[1].type, zero);
}

TEST(lexing, testIllegalCharacters)
{
    struct illegal_test
    {
        std::string_view input;
        std::string_view literal;
        location loc;
    };
    const auto tests = std::vector<illegal_test> {
        {"p & q", "&", at(1, 3)},
        {"2", "2", at(1, 1)},
        {"p : 1", ":", at(1, 3)},
        {"1 = 0", "=", at(1, 3)},
        {"1 <= 0", "<", at(1, 3)},
        {"p_q", "_", at(1, 2)},
        {"1\n 1 $", "$", at(2, 4)},
    };
    for (const auto& [input, literal, loc] : tests) {
        auto lxr = lexer {input};
        auto tok = lxr.next_token();
        while (tok.type != token_type::illegal && tok.type != token_type::eof) {
            tok = lxr.next_token();
        }
        EXPECT_EQ(tok, (token {.type = token_type::illegal, .literal = literal, .loc = loc}))
            << "while lexing `" << input << "`";
    }
}

TEST(lexing, testNulByteIsIllegalAndDoesNotEndTheInput)
{
    using enum token_type;
    auto lxr = lexer {std::string_view {"1\0$ ^ 0", 7}};
    EXPECT_EQ(lxr.next_token(), (token {.type = one, .literal = "1", .loc = at(1, 1)}));
    EXPECT_EQ(lxr.next_token(), (token {.type = illegal, .literal = std::string_view {"\0", 1}, .loc = at(1, 2)}));
    EXPECT_EQ(lxr.next_token(), (token {.type = illegal, .literal = "$", .loc = at(1, 3)}));
    EXPECT_EQ(lxr.next_token(), (token {.type = caret, .literal = "^", .loc = at(1, 5)}));
    EXPECT_EQ(lxr.next_token(), (token {.type = zero, .literal = "0", .loc = at(1, 7)}));
    EXPECT_EQ(lxr.next_token(), (token {.type = eof, .literal = "", .loc = at(1, 8)}));

    auto types = std::vector<token_type> {};
    for (const auto& tok : lex_all(std::string_view {"1 ^ 1\0 ^ 0", 10})) {
        types.push_back(tok.type);
    }
    EXPECT_EQ(types, (std::vector<token_type> {one, caret, one, illegal, caret, zero}));
}

TEST(lexing, testLexingIsRestartable)
{
    constexpr auto input = std::string_view {"p := 1\n~p"};
    EXPECT_EQ(lex_all(input), lex_all(input));
}

TEST(lexing, testFilenameIsPartOfTheLocation)
{
    auto lxr = lexer {"1", "statement.pl"};
    const auto tok = lxr.next_token();
    EXPECT_EQ(tok.loc, (location {.filename = "statement.pl", .line = 1, .column = 1}));
    EXPECT_EQ(fmt::format("{}", tok.loc), "statement.pl:1:1");
}
// NOLINTEND(*-magic-numbers)
