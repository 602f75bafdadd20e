#include "../include/tools.hpp"
#include "../include/expression.hpp"
#include "../../../shared/cpp/llm_sdk/include/util.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace {

std::string format_number(double v) {
    std::ostringstream os;
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        os << (long long)v;
    } else {
        os << std::setprecision(12) << v;
    }
    return os.str();
}

// Decodes the code point at `i`; malformed bytes decode as U+FFFD, one byte long.
char32_t decode_utf8(const std::string& s, size_t i, size_t& len) {
    unsigned char c = (unsigned char)s[i];
    len = 1;
    if (c < 0x80) return c;
    size_t extra = c >= 0xF8 ? 0 : c >= 0xF0 ? 3 : c >= 0xE0 ? 2 : c >= 0xC0 ? 1 : 0;
    if (extra == 0 || i + extra >= s.size()) return 0xFFFD;
    char32_t cp = c & (0x7F >> (extra + 1));
    for (size_t k = 1; k <= extra; ++k) {
        unsigned char b = (unsigned char)s[i + k];
        if ((b & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (b & 0x3F);
    }
    len = extra + 1;
    return cp;
}

// Letters, digits and '_'. Outside ASCII, the punctuation, symbol and space
// blocks are excluded and everything else counts as a letter.
bool is_word_code_point(char32_t cp) {
    if (cp < 0x80) return std::isalnum((int)cp) || cp == '_';
    if (cp <= 0xBF) {
        // ordinal indicators, micro sign, superscript digits, vulgar fractions
        return cp == 0xAA || cp == 0xB2 || cp == 0xB3 || cp == 0xB5 || cp == 0xB9 || cp == 0xBA ||
               (cp >= 0xBC && cp <= 0xBE);
    }
    if (cp == 0xD7 || cp == 0xF7) return false;
    if (cp >= 0x2000 && cp <= 0x206F) return false; // general punctuation, spaces
    if (cp >= 0x20A0 && cp <= 0x20CF) return false; // currency
    if (cp >= 0x2190 && cp <= 0x2BFF) return false; // arrows, operators, shapes, dingbats
    if (cp >= 0x2E00 && cp <= 0x2E7F) return false;
    if (cp >= 0x3000 && cp <= 0x303F) return cp >= 0x3005 && cp <= 0x3007;
    if (cp >= 0xFE10 && cp <= 0xFE6F) return false;
    if (cp >= 0xFF00 && cp <= 0xFF65) {
        // fullwidth digits and latin letters only
        return (cp >= 0xFF10 && cp <= 0xFF19) || (cp >= 0xFF21 && cp <= 0xFF3A) || (cp >= 0xFF41 && cp <= 0xFF5A);
    }
    if (cp == 0xFEFF || cp == 0xFFFD) return false;
    if (cp >= 0x1F000 && cp <= 0x1FAFF) return false; // emoji and pictographs
    return true;
}

long days_from_civil(long y, unsigned m, unsigned d) {
    y -= m <= 2;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = (unsigned)(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + (long)doe - 719468;
}

bool is_leap(long y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

} // namespace

std::string CalculatorTool::run(const std::string& query) const {
    std::string expr = trim(query);
    try {
        return "The result of " + expr + " is: " + format_number(evaluate_expression(expr));
    } catch (const std::exception& e) {
        return std::string("Error in calculation: ") + e.what() + ". Please check your mathematical expression.";
    }
}

TextStats TextAnalyzerTool::analyze(const std::string& text) {
    TextStats st;

    std::istringstream ws(text);
    std::string tok;
    while (ws >> tok) ++st.word_count;

    st.char_count = utf8_length(text);
    st.char_count_no_spaces = st.char_count - (size_t)std::count(text.begin(), text.end(), ' ');

    for (size_t i = 0; i < text.size();) {
        if (text[i] == '.' || text[i] == '!' || text[i] == '?') {
            ++st.sentence_count;
            while (i < text.size() && (text[i] == '.' || text[i] == '!' || text[i] == '?')) ++i;
        } else {
            ++i;
        }
    }

    size_t pos = 0;
    while (pos <= text.size()) {
        size_t next = text.find("\n\n", pos);
        std::string para = text.substr(pos, next == std::string::npos ? std::string::npos : next - pos);
        if (!trim(para).empty()) ++st.paragraph_count;
        if (next == std::string::npos) break;
        pos = next + 2;
    }

    // frequency of words longer than 3 characters, first-seen order kept for ties
    std::vector<std::pair<std::string, size_t>> freq;
    std::unordered_map<std::string, size_t> slot;
    for (size_t i = 0, len = 0; i < text.size();) {
        if (!is_word_code_point(decode_utf8(text, i, len))) { i += len; continue; }
        size_t start = i;
        while (i < text.size() && is_word_code_point(decode_utf8(text, i, len))) i += len;
        std::string word = to_lower(text.substr(start, i - start));
        if (utf8_length(word) <= 3) continue;
        auto it = slot.find(word);
        if (it == slot.end()) {
            slot.emplace(word, freq.size());
            freq.emplace_back(word, 1);
        } else {
            ++freq[it->second].second;
        }
    }
    std::stable_sort(freq.begin(), freq.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (freq.size() > kTopWords) freq.resize(kTopWords);
    st.top_words = std::move(freq);

    st.reading_minutes = (st.word_count + kWordsPerMinute - 1) / kWordsPerMinute;
    return st;
}

std::string TextAnalyzerTool::run(const std::string& text) const {
    try {
        auto st = analyze(text);
        std::ostringstream os;
        os << "Text Analysis Results:\n"
           << "- Word count: " << st.word_count << "\n"
           << "- Character count: " << st.char_count << "\n"
           << "- Character count (no spaces): " << st.char_count_no_spaces << "\n"
           << "- Sentence count: " << st.sentence_count << "\n"
           << "- Paragraph count: " << st.paragraph_count << "\n"
           << "- Estimated reading time: " << st.reading_minutes << " minute(s)\n"
           << "\nTop " << kTopWords << " most frequent words:\n";
        for (auto& w : st.top_words) {
            os << "- " << w.first << ": " << w.second << " times\n";
        }
        return os.str();
    } catch (const std::exception& e) {
        return std::string("Error analyzing text: ") + e.what();
    }
}

long days_from_iso_date(const std::string& iso) {
    static const std::regex re(R"((\d{4})-(\d{2})-(\d{2}))");
    std::smatch m;
    if (!std::regex_match(iso, m, re)) throw std::invalid_argument("time data '" + iso + "' does not match format YYYY-MM-DD");
    long y = std::stol(m[1]);
    unsigned mo = (unsigned)std::stoul(m[2]);
    unsigned d = (unsigned)std::stoul(m[3]);
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (mo < 1 || mo > 12) throw std::invalid_argument("month must be in 1..12 in '" + iso + "'");
    unsigned last = kDays[mo - 1] + (mo == 2 && is_leap(y) ? 1 : 0);
    if (d < 1 || d > last) throw std::invalid_argument("day is out of range for month in '" + iso + "'");
    return days_from_civil(y, mo, d);
}

std::string DateTimeTool::run(const std::string& query) const {
    try {
        std::string q = to_lower(trim(query));

        if (q == "current" || q == "now") {
            std::time_t now = clock ? clock() : std::time(nullptr);
            std::tm tm{};
            localtime_r(&now, &tm);
            std::ostringstream os;
            os << "Current date and time: " << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
            return os.str();
        }

        static const std::regex date_re(R"(\d{4}-\d{2}-\d{2})");
        std::vector<std::string> dates;
        for (std::sregex_iterator it(q.begin(), q.end(), date_re), end; it != end; ++it) {
            dates.push_back(it->str());
        }
        if (dates.size() >= 2) {
            long diff = std::labs(days_from_iso_date(dates[1]) - days_from_iso_date(dates[0]));
            return "Days between " + dates[0] + " and " + dates[1] + ": " + std::to_string(diff) + " days";
        }
        if (q.find("days between") != std::string::npos) {
            return "Please provide dates in YYYY-MM-DD format";
        }
        return "Available operations: 'current' for current datetime, "
               "'days between YYYY-MM-DD and YYYY-MM-DD' for date calculations";
    } catch (const std::exception& e) {
        return std::string("Error with date/time operation: ") + e.what();
    }
}
