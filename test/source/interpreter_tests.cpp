#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <error/error.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <graph/dot.hpp>
#include <gtest/gtest.h>
#include <interpreter.hpp>

// NOLINTBEGIN(*-magic-numbers)
TEST(interpreter, testSuccessfulRuns)
{
    struct run_test
    {
        std::string_view input;
        bool expected;
    };
    const auto tests = std::vector<run_test> {
        {"1 ^ 0", false},
        {"1 v 0", true},
        {"~1", false},
        {"0 <=> 0", true},
        {"p := 1\nq := 0\n~p v ~q", true},
        {"p := 1\nq := 1\np => q\n", true},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = interpret(input);
        const auto* output = std::get_if<run_output>(&result);
        ASSERT_NE(output, nullptr) << "running `" << input << "` failed: " << std::get<error>(result);
        EXPECT_EQ(output->value, expected) << "while running `" << input << "`";
    }
}

TEST(interpreter, testRunKeepsProgramAndBindings)
{
    const auto result = interpret("p := 1\nq := 0\np ^ ~q");
    const auto* output = std::get_if<run_output>(&result);
    ASSERT_NE(output, nullptr);
    EXPECT_TRUE(output->value);
    ASSERT_TRUE(output->prgrm);
    EXPECT_EQ(output->prgrm->assignments.size(), 2U);
    EXPECT_EQ(output->prgrm->expr->string(), "(p ^ (~q))");
    EXPECT_EQ(output->env.size(), 2U);
    EXPECT_EQ(output->env.get("q"), false);
}

TEST(interpreter, testErrorsNameTheirStage)
{
    struct failure_test
    {
        std::string_view input;
        std::string_view stage;
        std::string_view message;
    };
    const auto tests = std::vector<failure_test> {
        {"1 & 0", "lexer", "<stdin>:1:3: lexer error: unexpected character '&'"},
        {"(1 v 0", "parser", "<stdin>:1:7: parser error: expected next token to be ), got eof instead"},
        {"p := 1\np := 0\np", "parser", "<stdin>:2:1: parser error: variable p is already assigned"},
        {"", "parser", "<stdin>:1:1: parser error: expected an expression, got eof instead"},
        {"1 v", "parser", "<stdin>:1:4: parser error: expected next token to be 0 or 1 or identifier or ~ or (, got eof instead"},
        {"p v q", "evaluation", "<stdin>:1:1: evaluation error: identifier not found: p"},
        {std::string_view {"1\0$ ^ 0", 7}, "lexer", "<stdin>:1:2: lexer error: unexpected character '\\x00'"},
        {std::string_view {"1 ^ 1\0 ^ 0", 10}, "lexer", "<stdin>:1:6: lexer error: unexpected character '\\x00'"},
        {"p v \xC3\xA9", "lexer", "<stdin>:1:5: lexer error: unexpected character '\\xC3'"},
        {"1 ^\t#", "lexer", "<stdin>:1:5: lexer error: unexpected character '#'"},
    };
    for (const auto& [input, stage, message] : tests) {
        const auto result = interpret(input);
        const auto* err = std::get_if<error>(&result);
        ASSERT_NE(err, nullptr) << "expected `" << input << "` to fail";
        EXPECT_EQ(error_stage(*err), stage) << "while running `" << input << "`";
        EXPECT_EQ(fmt::format("{}", fmt::streamed(*err)), message) << "while running `" << input << "`";
    }
}

TEST(interpreter, testTooDeepNestingIsReportedNotFatal)
{
    const auto input = std::string(300000, '~') + "1";
    const auto result = interpret(input);
    const auto* err = std::get_if<error>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(fmt::format("{}", fmt::streamed(*err)),
              "<stdin>:1:1001: parser error: expression nests deeper than 1000 levels");
}

TEST(interpreter, testParsedStatementOutlivesEvaluationErrors)
{
    constexpr auto input = std::string_view {"p := 1\np v q"};
    ASSERT_TRUE(std::holds_alternative<error>(interpret(input)));

    const auto parsed = parse_statement(input);
    const auto* stmt = std::get_if<parsed_statement>(&parsed);
    ASSERT_NE(stmt, nullptr);
    EXPECT_EQ(stmt->env.get("p"), true);
    EXPECT_EQ(to_dot(*stmt->prgrm->expr),
              "graph G {\n"
              "    0 [label=\"v\" shape=\"box\"]\n"
              "    1 [label=\"p\"]\n"
              "    2 [label=\"q\"]\n"
              "    0 -- 1\n"
              "    0 -- 2\n"
              "}\n");
}

TEST(interpreter, testParseStatementReportsSyntaxErrors)
{
    const auto parsed = parse_statement("(1 v 0");
    const auto* err = std::get_if<error>(&parsed);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(error_stage(*err), "parser");
}

TEST(interpreter, testFilenameIsReported)
{
    const auto result = interpret("p := 1\n\n~p ^ q", "vars.pl");
    const auto* err = std::get_if<error>(&result);
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(fmt::format("{}", fmt::streamed(*err)), "vars.pl:3:6: evaluation error: identifier not found: q");
    EXPECT_EQ(error_location(*err).line, 3U);
}
// NOLINTEND(*-magic-numbers)
