#pragma once

#include <map>
#include <string>

namespace cskit::host::memory {

/**
 * Evaluator for the scripted-expression subset emitted by the synthesizers.
 *
 * Grammar: decimal literals, symbols, the constant `pi`, unary `+`/`-`,
 * binary `+ - * /` with the usual precedence, parentheses and the calls
 * `fabs sqrt pow acos clamp min max`. Unknown symbols or functions, wrong
 * argument counts and trailing input throw std::runtime_error.
 */
class ExpressionEvaluator {
public:
    using Symbols = std::map<std::string, double>;

    explicit ExpressionEvaluator(std::string expression);

    double evaluate(const Symbols& symbols) const;

    const std::string& expression() const { return expression_; }

private:
    std::string expression_{};
};

double evaluateExpression(const std::string& expression, const ExpressionEvaluator::Symbols& symbols);

} // namespace cskit::host::memory
