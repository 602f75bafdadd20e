#include "../include/expression.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <map>

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kE = 2.71828182845904523536;
constexpr int kMaxDepth = 256;

struct Function {
    size_t min_args;
    size_t max_args;
    double (*fn)(const std::vector<double>&);
};

double check_domain(double v) {
    if (std::isnan(v)) throw ExpressionError("math domain error");
    return v;
}

const std::map<std::string, double>& constants() {
    static const std::map<std::string, double> c = {
        {"pi", kPi},
        {"e", kE},
        {"tau", 2.0 * kPi},
    };
    return c;
}

const std::map<std::string, Function>& functions() {
    static const std::map<std::string, Function> f = {
        {"sqrt",  {1, 1, [](const std::vector<double>& a) { return std::sqrt(a[0]); }}},
        {"sin",   {1, 1, [](const std::vector<double>& a) { return std::sin(a[0]); }}},
        {"cos",   {1, 1, [](const std::vector<double>& a) { return std::cos(a[0]); }}},
        {"tan",   {1, 1, [](const std::vector<double>& a) { return std::tan(a[0]); }}},
        {"asin",  {1, 1, [](const std::vector<double>& a) { return std::asin(a[0]); }}},
        {"acos",  {1, 1, [](const std::vector<double>& a) { return std::acos(a[0]); }}},
        {"atan",  {1, 1, [](const std::vector<double>& a) { return std::atan(a[0]); }}},
        {"sinh",  {1, 1, [](const std::vector<double>& a) { return std::sinh(a[0]); }}},
        {"cosh",  {1, 1, [](const std::vector<double>& a) { return std::cosh(a[0]); }}},
        {"tanh",  {1, 1, [](const std::vector<double>& a) { return std::tanh(a[0]); }}},
        {"exp",   {1, 1, [](const std::vector<double>& a) { return std::exp(a[0]); }}},
        {"log",   {1, 2, [](const std::vector<double>& a) {
            if (a[0] <= 0.0 || (a.size() == 2 && (a[1] <= 0.0 || a[1] == 1.0))) throw ExpressionError("math domain error");
            return a.size() == 2 ? std::log(a[0]) / std::log(a[1]) : std::log(a[0]);
        }}},
        {"log10", {1, 1, [](const std::vector<double>& a) {
            if (a[0] <= 0.0) throw ExpressionError("math domain error");
            return std::log10(a[0]);
        }}},
        {"log2",  {1, 1, [](const std::vector<double>& a) {
            if (a[0] <= 0.0) throw ExpressionError("math domain error");
            return std::log2(a[0]);
        }}},
        {"abs",   {1, 1, [](const std::vector<double>& a) { return std::fabs(a[0]); }}},
        {"fabs",  {1, 1, [](const std::vector<double>& a) { return std::fabs(a[0]); }}},
        {"round", {1, 1, [](const std::vector<double>& a) { return std::nearbyint(a[0]); }}},
        {"floor", {1, 1, [](const std::vector<double>& a) { return std::floor(a[0]); }}},
        {"ceil",  {1, 1, [](const std::vector<double>& a) { return std::ceil(a[0]); }}},
        {"pow",   {2, 2, [](const std::vector<double>& a) { return std::pow(a[0], a[1]); }}},
        {"min",   {1, 64, [](const std::vector<double>& a) { return *std::min_element(a.begin(), a.end()); }}},
        {"max",   {1, 64, [](const std::vector<double>& a) { return *std::max_element(a.begin(), a.end()); }}},
    };
    return f;
}

std::string list_names(const std::vector<std::string>& names) {
    std::string out;
    for (auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out;
}

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    double parse() {
        double v = expr();
        skip_ws();
        if (pos_ != s_.size()) fail_unexpected();
        return v;
    }

private:
    double expr() {
        double v = term();
        for (;;) {
            if (accept('+')) v += term();
            else if (accept('-')) v -= term();
            else return v;
        }
    }

    double term() {
        double v = unary();
        for (;;) {
            skip_ws();
            if (peek() == '*' && peek(1) != '*') {
                ++pos_;
                v *= unary();
            } else if (accept('/')) {
                double d = unary();
                if (d == 0.0) throw ExpressionError("division by zero");
                v /= d;
            } else if (accept('%')) {
                double d = unary();
                if (d == 0.0) throw ExpressionError("modulo by zero");
                v = v - std::floor(v / d) * d;
            } else {
                return v;
            }
        }
    }

    // Every recursive path (parentheses, call arguments, exponents, sign
    // chains) passes through here, so this bounds the native stack.
    double unary() {
        DepthGuard guard(depth_);
        if (accept('-')) return -unary();
        if (accept('+')) return unary();
        return power();
    }

    double power() {
        double base = primary();
        skip_ws();
        bool is_pow = false;
        if (peek() == '^') { ++pos_; is_pow = true; }
        else if (peek() == '*' && peek(1) == '*') { pos_ += 2; is_pow = true; }
        if (!is_pow) return base;
        // right associative: 2^3^2 == 2^(3^2)
        double exponent = unary();
        double v = std::pow(base, exponent);
        if (base == 0.0 && exponent < 0.0) throw ExpressionError("division by zero");
        return check_domain(v);
    }

    double primary() {
        skip_ws();
        char c = peek();
        if (accept('(')) {
            double v = expr();
            expect(')');
            return v;
        }
        if (std::isdigit((unsigned char)c) || c == '.') return number();
        if (std::isalpha((unsigned char)c) || c == '_') return name();
        if (pos_ >= s_.size()) throw ExpressionError("unexpected end of expression");
        fail_unexpected();
        return 0.0;
    }

    // digits [ '.' digits ] [ ('e' | 'E') [sign] digits ]
    double number() {
        size_t start = pos_;
        skip_digits();
        if (peek() == '.') {
            ++pos_;
            skip_digits();
        }
        if (pos_ - start == 1 && s_[start] == '.') {
            pos_ = start;
            fail_unexpected();
        }
        if (peek() == 'e' || peek() == 'E') {
            size_t mark = pos_;
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (std::isdigit((unsigned char)peek())) skip_digits();
            else pos_ = mark;
        }
        return std::strtod(s_.substr(start, pos_ - start).c_str(), nullptr);
    }

    void skip_digits() {
        while (std::isdigit((unsigned char)peek())) ++pos_;
    }

    double name() {
        size_t start = pos_;
        while (pos_ < s_.size() && (std::isalnum((unsigned char)s_[pos_]) || s_[pos_] == '_')) ++pos_;
        std::string id = s_.substr(start, pos_ - start);

        skip_ws();
        if (peek() == '(') {
            auto fit = functions().find(id);
            if (fit == functions().end()) throw ExpressionError("unknown function '" + id + "' (available: " +
                                                                 list_names(expression_functions()) + ")");
            ++pos_;
            std::vector<double> args;
            args.push_back(expr());
            while (accept(',')) args.push_back(expr());
            expect(')');
            const Function& f = fit->second;
            if (args.size() < f.min_args || args.size() > f.max_args) {
                throw ExpressionError(id + "() takes " + std::to_string(f.min_args) +
                                      (f.max_args != f.min_args ? " to " + std::to_string(f.max_args) : std::string()) +
                                      " argument(s), got " + std::to_string(args.size()));
            }
            return check_domain(f.fn(args));
        }
        auto cit = constants().find(id);
        if (cit == constants().end()) throw ExpressionError("name '" + id + "' is not defined (constants: " +
                                                                   list_names(expression_constants()) + ")");
        return cit->second;
    }

    void skip_ws() {
        while (pos_ < s_.size() && std::isspace((unsigned char)s_[pos_])) ++pos_;
    }

    char peek(size_t ahead = 0) const {
        return pos_ + ahead < s_.size() ? s_[pos_ + ahead] : '\0';
    }

    bool accept(char c) {
        skip_ws();
        if (peek() != c) return false;
        ++pos_;
        return true;
    }

    void expect(char c) {
        if (!accept(c)) {
            if (pos_ >= s_.size()) throw ExpressionError(std::string("expected '") + c + "' before end of expression");
            fail_unexpected();
        }
    }

    [[noreturn]] void fail_unexpected() const {
        throw ExpressionError("unexpected character '" + std::string(1, s_[pos_]) +
                              "' at position " + std::to_string(pos_ + 1));
    }

    struct DepthGuard {
        explicit DepthGuard(int& depth) : depth_(depth) {
            if (++depth_ > kMaxDepth) throw ExpressionError("expression nested too deeply");
        }
        ~DepthGuard() { --depth_; }
        int& depth_;
    };

    const std::string& s_;
    size_t pos_{0};
    int depth_{0};
};

std::vector<std::string> keys_of(const std::map<std::string, double>& m) {
    std::vector<std::string> out;
    for (auto& kv : m) out.push_back(kv.first);
    return out;
}

} // namespace

double evaluate_expression(const std::string& text) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) throw ExpressionError("empty expression");
    double v = Parser(text).parse();
    if (std::isinf(v)) throw ExpressionError("result out of range");
    return v;
}

const std::vector<std::string>& expression_functions() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (auto& kv : functions()) out.push_back(kv.first);
        return out;
    }();
    return names;
}

const std::vector<std::string>& expression_constants() {
    static const std::vector<std::string> names = keys_of(constants());
    return names;
}
