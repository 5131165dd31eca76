#include "expression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <numbers>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace cskit::host::memory {

namespace {

class Parser {
public:
    Parser(const std::string& text, const ExpressionEvaluator::Symbols& symbols) : text_(text), symbols_(symbols) {}

    double parse() {
        double value = parseSum();
        skipSpace();
        if (pos_ != text_.size()) fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        return value;
    }

private:
    const std::string& text_;
    const ExpressionEvaluator::Symbols& symbols_;
    std::size_t pos_{0};

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("expression '" + text_ + "' at " + std::to_string(pos_) + ": " + what);
    }

    void skipSpace() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
    }

    bool accept(char c) {
        skipSpace();
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(char c) {
        if (!accept(c)) fail(std::string("expected '") + c + "'");
    }

    double parseSum() {
        double value = parseProduct();
        for (;;) {
            if (accept('+')) {
                value = value + parseProduct();
            } else if (accept('-')) {
                value = value - parseProduct();
            } else {
                return value;
            }
        }
    }

    double parseProduct() {
        double value = parseUnary();
        for (;;) {
            if (accept('*')) {
                value = value * parseUnary();
            } else if (accept('/')) {
                const double rhs = parseUnary();
                if (rhs == 0.0) fail("division by zero");
                value = value / rhs;
            } else {
                return value;
            }
        }
    }

    double parseUnary() {
        if (accept('-')) return -parseUnary();
        if (accept('+')) return parseUnary();
        return parsePrimary();
    }

    double parsePrimary() {
        skipSpace();
        if (pos_ >= text_.size()) fail("unexpected end");
        const char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            double value = parseSum();
            expect(')');
            return value;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') return parseNumber();
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            std::string name = parseName();
            if (accept('(')) return call(name, parseArguments());
            if (name == "pi") return std::numbers::pi;
            auto it = symbols_.find(name);
            if (it == symbols_.end()) fail("unknown symbol '" + name + "'");
            return it->second;
        }
        fail("unexpected '" + std::string(1, c) + "'");
    }

    double parseNumber() {
        double value = 0.0;
        auto res = std::from_chars(text_.data() + pos_, text_.data() + text_.size(), value);
        if (res.ec != std::errc{}) fail("bad number");
        pos_ = static_cast<std::size_t>(res.ptr - text_.data());
        return value;
    }

    std::string parseName() {
        const std::size_t start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) || text_[pos_] == '_')) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    std::vector<double> parseArguments() {
        std::vector<double> args;
        if (accept(')')) return args;
        do {
            args.push_back(parseSum());
        } while (accept(','));
        expect(')');
        return args;
    }

    double call(const std::string& name, const std::vector<double>& args) {
        auto arity = [&](std::size_t n) {
            if (args.size() != n) fail(name + " takes " + std::to_string(n) + " arguments");
        };
        if (name == "fabs") {
            arity(1);
            return std::fabs(args[0]);
        }
        if (name == "sqrt") {
            arity(1);
            return std::sqrt(args[0]);
        }
        if (name == "acos") {
            arity(1);
            return std::acos(args[0]);
        }
        if (name == "pow") {
            arity(2);
            return std::pow(args[0], args[1]);
        }
        if (name == "clamp") {
            arity(3);
            return std::clamp(args[0], args[1], args[2]);
        }
        if (name == "min" || name == "max") {
            if (args.empty()) fail(name + " needs at least one argument");
            return name == "min" ? *std::min_element(args.begin(), args.end())
                                 : *std::max_element(args.begin(), args.end());
        }
        fail("unknown function '" + name + "'");
    }
};

} // namespace

ExpressionEvaluator::ExpressionEvaluator(std::string expression) : expression_(std::move(expression)) {}

double ExpressionEvaluator::evaluate(const Symbols& symbols) const {
    return Parser(expression_, symbols).parse();
}

double evaluateExpression(const std::string& expression, const ExpressionEvaluator::Symbols& symbols) {
    return ExpressionEvaluator(expression).evaluate(symbols);
}

} // namespace cskit::host::memory
