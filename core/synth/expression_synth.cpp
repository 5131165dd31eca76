#include "expression_synth.hpp"

#include "../common/utils.hpp"
#include "../debug_log.hpp"

namespace cskit::core::synth {

std::string poseLiteral(double poseValue, int precision) {
    return common::formatLiteral(poseValue, precision);
}

std::string synthesizeExpression(const std::vector<ExpressionSymbol>& symbols, metric::MetricKind kind) {
    if (symbols.empty()) return "1.0";

    std::vector<std::string> terms;
    terms.reserve(symbols.size());

    switch (kind) {
    case metric::MetricKind::Euclidean:
        for (const auto& s : symbols) terms.push_back("pow(" + s.name + "-" + s.literal + ",2.0)");
        return "sqrt(" + common::join(terms, "+") + ")";
    case metric::MetricKind::Quaternion:
        if (symbols.size() != 4) {
            CSKIT_DBG_LOG("[cskit] quaternion expression over %zu variables\n", symbols.size());
        }
        for (const auto& s : symbols) terms.push_back(s.name + "*" + s.literal);
        return "acos((2.0*pow(clamp(" + common::join(terms, "+") + ",-1.0,1.0),2.0))-1.0)/pi";
    case metric::MetricKind::Absolute:
        break;
    }

    if (symbols.size() == 1) {
        return "fabs(" + symbols.front().name + "-" + symbols.front().literal + ")";
    }
    for (const auto& s : symbols) terms.push_back("fabs(" + s.name + "-" + s.literal + ")");
    return "(" + common::join(terms, "+") + ")/" + common::formatDecimal(static_cast<double>(symbols.size()));
}

} // namespace cskit::core::synth
