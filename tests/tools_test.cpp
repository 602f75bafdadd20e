#include "../agents/research/include/expression.hpp"
#include "../agents/research/include/tool_registry.hpp"
#include "../agents/research/include/tools.hpp"
#include "../shared/cpp/llm_sdk/include/errors.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace {
bool contains(const std::string& s, const std::string& part) {
    return s.find(part) != std::string::npos;
}
}

TEST(Expression, Arithmetic) {
    EXPECT_DOUBLE_EQ(evaluate_expression("2+2"), 4.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("10*5/2"), 25.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("2 + 3 * 4"), 14.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("(2 + 3) * 4"), 20.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("-3 + 5"), 2.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("7 % 3"), 1.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("1.5e2"), 150.0);
}

TEST(Expression, PowerIsRightAssociativeAndBindsTighterThanUnaryMinus) {
    EXPECT_DOUBLE_EQ(evaluate_expression("2^10"), 1024.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("2**3"), 8.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("2^3^2"), 512.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("-2^2"), -4.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("2^-1"), 0.5);
}

TEST(Expression, WhitelistedFunctionsAndConstants) {
    EXPECT_DOUBLE_EQ(evaluate_expression("sqrt(16)"), 4.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("sqrt(144)"), 12.0);
    EXPECT_NEAR(evaluate_expression("sin(pi/2)"), 1.0, 1e-12);
    EXPECT_NEAR(evaluate_expression("log(e)"), 1.0, 1e-12);
    EXPECT_NEAR(evaluate_expression("log(8, 2)"), 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(evaluate_expression("max(1, 7, 3)"), 7.0);
    EXPECT_DOUBLE_EQ(evaluate_expression("abs(-2.5)"), 2.5);
    EXPECT_DOUBLE_EQ(evaluate_expression("pow(3, 2)"), 9.0);
}

TEST(Expression, RejectsUnknownNamesAndSyntax) {
    EXPECT_THROW(evaluate_expression("__import__('os')"), ExpressionError);
    EXPECT_THROW(evaluate_expression("os.system('ls')"), ExpressionError);
    EXPECT_THROW(evaluate_expression("x + 1"), ExpressionError);
    EXPECT_THROW(evaluate_expression("2 +"), ExpressionError);
    EXPECT_THROW(evaluate_expression("(1"), ExpressionError);
    EXPECT_THROW(evaluate_expression("1 2"), ExpressionError);
    EXPECT_THROW(evaluate_expression(""), ExpressionError);
    EXPECT_THROW(evaluate_expression("sqrt(1, 2)"), ExpressionError);
}

TEST(Expression, NumbersAreDecimalOnly) {
    EXPECT_DOUBLE_EQ(evaluate_expression(".5 + 1."), 1.5);
    EXPECT_DOUBLE_EQ(evaluate_expression("2E-1"), 0.2);
    EXPECT_THROW(evaluate_expression("0x10"), ExpressionError);
    EXPECT_THROW(evaluate_expression("0x1p3"), ExpressionError);
    EXPECT_THROW(evaluate_expression("2e"), ExpressionError);
    EXPECT_THROW(evaluate_expression("."), ExpressionError);
}

TEST(Expression, UnknownNamesListTheWhitelist) {
    try {
        evaluate_expression("cbrt(8)");
        FAIL() << "expected ExpressionError";
    } catch (const ExpressionError& e) {
        EXPECT_TRUE(contains(e.what(), "unknown function 'cbrt'"));
        EXPECT_TRUE(contains(e.what(), "sqrt"));
    }
    try {
        evaluate_expression("x + 1");
        FAIL() << "expected ExpressionError";
    } catch (const ExpressionError& e) {
        EXPECT_TRUE(contains(e.what(), "name 'x' is not defined"));
        EXPECT_TRUE(contains(e.what(), "pi"));
    }
}

TEST(Expression, BoundsNestingDepth) {
    EXPECT_DOUBLE_EQ(evaluate_expression(std::string(100, '(') + "1" + std::string(100, ')')), 1.0);
    EXPECT_DOUBLE_EQ(evaluate_expression(std::string(200, '-') + "1"), 1.0);
    EXPECT_THROW(evaluate_expression(std::string(300, '(') + "1" + std::string(300, ')')), ExpressionError);
    EXPECT_THROW(evaluate_expression(std::string(300, '-') + "1"), ExpressionError);
}

TEST(Expression, ReportsMathErrors) {
    EXPECT_THROW(evaluate_expression("1/0"), ExpressionError);
    EXPECT_THROW(evaluate_expression("sqrt(-1)"), ExpressionError);
    EXPECT_THROW(evaluate_expression("log(0)"), ExpressionError);
    EXPECT_THROW(evaluate_expression("10^400"), ExpressionError);
}

TEST(CalculatorTool, FormatsResult) {
    CalculatorTool calc;
    EXPECT_EQ(calc.run("2+2"), "The result of 2+2 is: 4");
    EXPECT_TRUE(contains(calc.run("sqrt(16)"), "is: 4"));
    EXPECT_TRUE(contains(calc.run("1/4"), "0.25"));
}

TEST(CalculatorTool, NeverThrowsAndReportsErrors) {
    CalculatorTool calc;
    std::string out;
    EXPECT_NO_THROW(out = calc.run("__import__('os')"));
    EXPECT_TRUE(contains(out, "Error in calculation"));
    EXPECT_TRUE(contains(out, "__import__"));
    EXPECT_TRUE(contains(calc.run("1/0"), "division by zero"));
}

TEST(CalculatorTool, DeeplyNestedInputIsReportedNotFatal) {
    CalculatorTool calc;
    std::string out;
    EXPECT_NO_THROW(out = calc.run(std::string(100000, '(') + "1"));
    EXPECT_TRUE(contains(out, "Error in calculation: expression nested too deeply"));
    EXPECT_NO_THROW(out = calc.run(std::string(100000, '-') + "1"));
    EXPECT_TRUE(contains(out, "expression nested too deeply"));
    EXPECT_NO_THROW(out = calc.run(std::string(200000, '(') + "1" + std::string(200000, ')')));
    EXPECT_TRUE(contains(out, "expression nested too deeply"));
}

TEST(TextAnalyzerTool, CountsSentencesAndWords) {
    auto st = TextAnalyzerTool::analyze("A simple test. Another sentence!");
    EXPECT_EQ(st.sentence_count, 2u);
    EXPECT_EQ(st.word_count, 5u);
    EXPECT_EQ(st.char_count, 32u);
    EXPECT_EQ(st.char_count_no_spaces, 28u);
    EXPECT_EQ(st.paragraph_count, 1u);
    EXPECT_EQ(st.reading_minutes, 1u);
}

TEST(TextAnalyzerTool, ParagraphsAndEllipsis) {
    auto st = TextAnalyzerTool::analyze("Wait... what?!\n\nNew paragraph here.\n\n\n\n");
    EXPECT_EQ(st.sentence_count, 3u);
    EXPECT_EQ(st.paragraph_count, 2u);
}

TEST(TextAnalyzerTool, TopWordsTieBreakByFirstOccurrence) {
    auto st = TextAnalyzerTool::analyze(
        "delta alpha beta gamma alpha Delta zeta omega sigma kappa lambda the and");
    ASSERT_EQ(st.top_words.size(), 5u);
    EXPECT_EQ(st.top_words[0], (std::pair<std::string, size_t>{"delta", 2}));
    EXPECT_EQ(st.top_words[1], (std::pair<std::string, size_t>{"alpha", 2}));
    EXPECT_EQ(st.top_words[2].first, "beta");
    EXPECT_EQ(st.top_words[3].first, "gamma");
    EXPECT_EQ(st.top_words[4].first, "zeta");
}

TEST(TextAnalyzerTool, UnicodePunctuationSeparatesWords) {
    // em dash, curly quotes
    auto st = TextAnalyzerTool::analyze("alpha" "\xE2\x80\x94" "beta alpha" "\xE2\x80\x94" "beta "
                                        "\xE2\x80\x9C" "gamma" "\xE2\x80\x9D" " gamma");
    ASSERT_EQ(st.top_words.size(), 3u);
    EXPECT_EQ(st.top_words[0], (std::pair<std::string, size_t>{"alpha", 2}));
    EXPECT_EQ(st.top_words[1], (std::pair<std::string, size_t>{"beta", 2}));
    EXPECT_EQ(st.top_words[2], (std::pair<std::string, size_t>{"gamma", 2}));

    // no-break space, ellipsis; accented letters stay inside the word
    auto latin = TextAnalyzerTool::analyze("delta" "\xC2\xA0" "delta" "\xE2\x80\xA6" "delta caf" "\xC3\xA9" " caf" "\xC3\xA9");
    ASSERT_EQ(latin.top_words.size(), 2u);
    EXPECT_EQ(latin.top_words[0], (std::pair<std::string, size_t>{"delta", 3}));
    EXPECT_EQ(latin.top_words[1], (std::pair<std::string, size_t>{"caf\xC3\xA9", 2}));
}

TEST(TextAnalyzerTool, ReadingTimeRoundsUp) {
    std::string text;
    for (int i = 0; i < 201; ++i) text += "word ";
    EXPECT_EQ(TextAnalyzerTool::analyze(text).reading_minutes, 2u);
    EXPECT_EQ(TextAnalyzerTool::analyze("").reading_minutes, 0u);
}

TEST(TextAnalyzerTool, ReportText) {
    auto out = TextAnalyzerTool().run("A simple test. Another sentence!");
    EXPECT_TRUE(contains(out, "- Word count: 5"));
    EXPECT_TRUE(contains(out, "- Sentence count: 2"));
    EXPECT_TRUE(contains(out, "- simple: 1 times"));
}

TEST(DateTimeTool, DaysBetween) {
    DateTimeTool dt;
    EXPECT_EQ(dt.run("days between 2024-01-01 and 2024-12-31"), "Days between 2024-01-01 and 2024-12-31: 365 days");
    EXPECT_TRUE(contains(dt.run("How many days are there between 2024-12-31 and 2024-01-01?"), ": 365 days"));
    EXPECT_TRUE(contains(dt.run("days between 2023-02-28 and 2023-03-01"), ": 1 days"));
    EXPECT_TRUE(contains(dt.run("days between 2000-01-01 and 2000-01-01"), ": 0 days"));
}

TEST(DateTimeTool, CurrentUsesClock) {
    DateTimeTool dt;
    dt.clock = [] { return (std::time_t)0; };
    auto out = dt.run("  NOW ");
    EXPECT_EQ(out.rfind("Current date and time: ", 0), 0u);
    EXPECT_EQ(out.size(), std::string("Current date and time: YYYY-MM-DD HH:MM:SS").size());
}

TEST(DateTimeTool, UsageAndErrors) {
    DateTimeTool dt;
    EXPECT_EQ(dt.run("days between yesterday and today"), "Please provide dates in YYYY-MM-DD format");
    EXPECT_TRUE(contains(dt.run("what is love"), "Available operations"));
    EXPECT_TRUE(contains(dt.run("days between 2023-02-29 and 2023-03-01"), "Error with date/time operation"));
}

TEST(DaysFromIsoDate, Epoch) {
    EXPECT_EQ(days_from_iso_date("1970-01-01"), 0);
    EXPECT_EQ(days_from_iso_date("2000-03-01"), 11017);
    EXPECT_THROW(days_from_iso_date("2024-13-01"), std::invalid_argument);
}

TEST(ToolRegistry, ShipsThreeToolsInOrder) {
    ToolRegistry reg;
    EXPECT_EQ(reg.names(), (std::vector<std::string>{"calculator", "text_analyzer", "datetime_tool"}));
    auto specs = reg.specs();
    ASSERT_EQ(specs.size(), 3u);
    EXPECT_TRUE(contains(specs[0].description, "mathematical"));
}

TEST(ToolRegistry, DispatchesByName) {
    ToolRegistry reg;
    EXPECT_EQ(*reg.run("calculator", "3*3"), "The result of 3*3 is: 9");
    EXPECT_TRUE(contains(*reg.run(" Calculator ", "1+1"), "is: 2"));
    EXPECT_TRUE(contains(*reg.run("datetime_tool", "days between 2024-01-01 and 2024-01-31"), "30 days"));
    EXPECT_FALSE(reg.run("shell", "rm -rf /").has_value());
    EXPECT_EQ(reg.find("shell"), nullptr);
}

TEST(ToolRegistry, RejectsDuplicateNames) {
    EXPECT_THROW(ToolRegistry reg(std::vector<Tool>{CalculatorTool{}, CalculatorTool{}}), ConfigError);
}
