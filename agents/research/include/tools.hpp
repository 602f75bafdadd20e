#pragma once
#include <ctime>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Every tool's run() converts its own failures into a descriptive result
// string; none of them throws.

struct CalculatorTool {
    static constexpr const char* kName = "calculator";
    static constexpr const char* kDescription =
        "Useful for performing mathematical calculations. Input should be a mathematical expression "
        "like '2+2' or 'sqrt(16)' or '10*5/2'";

    std::string run(const std::string& query) const;
};

struct TextStats {
    size_t word_count{0};
    size_t char_count{0};
    size_t char_count_no_spaces{0};
    size_t sentence_count{0};
    size_t paragraph_count{0};
    size_t reading_minutes{0};
    std::vector<std::pair<std::string, size_t>> top_words;
};

struct TextAnalyzerTool {
    static constexpr const char* kName = "text_analyzer";
    static constexpr const char* kDescription =
        "Useful for analyzing text content. Can count words, characters, sentences, find keywords, "
        "and provide basic text statistics. Input should be the text to analyze.";
    static constexpr size_t kWordsPerMinute = 200;
    static constexpr size_t kTopWords = 5;

    static TextStats analyze(const std::string& text);
    std::string run(const std::string& text) const;
};

struct DateTimeTool {
    static constexpr const char* kName = "datetime_tool";
    static constexpr const char* kDescription =
        "Useful for getting current date/time, calculating date differences, or formatting dates. "
        "Input can be 'current' for current datetime, or date calculations like "
        "'days between 2024-01-01 and 2024-12-31'";

    // Defaults to the system clock.
    std::function<std::time_t()> clock;

    std::string run(const std::string& query) const;
};

// Days since 1970-01-01 of an ISO YYYY-MM-DD date. Throws std::invalid_argument
// for malformed or impossible dates.
long days_from_iso_date(const std::string& iso);
