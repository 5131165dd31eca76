#pragma once

#include "../metric/distance_metric.hpp"

#include <string>
#include <vector>

namespace cskit::core::synth {

// A live-bound variable name paired with its pose literal.
struct ExpressionSymbol {
    std::string name{};
    std::string literal{};
};

// Literal text of a pose value rounded to `precision` decimal places.
std::string poseLiteral(double poseValue, int precision);

// Scripted expression computing computeDistance with each symbol's live value in
// place of the rest value and its literal as the pose.
std::string synthesizeExpression(const std::vector<ExpressionSymbol>& symbols, metric::MetricKind kind);

} // namespace cskit::core::synth
