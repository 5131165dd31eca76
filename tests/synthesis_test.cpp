#include "../core/metric/distance_metric.hpp"
#include "../core/synth/combination.hpp"
#include "../core/synth/expression_synth.hpp"

#include <cassert>
#include <cmath>
#include <numbers>
#include <string>
#include <variant>

using namespace cskit::core;
using metric::MetricKind;
using metric::MetricSample;

namespace {

bool nearlyEqual(double a, double b, double eps = 1e-12) {
    return std::fabs(a - b) <= eps;
}

void testAbsoluteDistance() {
    assert(metric::computeDistance({{0.0, 1.0}, {0.0, 0.5}}, MetricKind::Absolute) == 0.75);
    assert(metric::computeDistance({{2.0, -1.0}}, MetricKind::Absolute) == 3.0);
    assert(metric::computeDistance({}, MetricKind::Absolute) == 0.0);
}

void testEuclideanDistance() {
    assert(metric::computeDistance({{0.0, 3.0}, {0.0, 4.0}}, MetricKind::Euclidean) == 5.0);
    assert(metric::computeDistance({{1.0, 1.0}}, MetricKind::Euclidean) == 0.0);
}

void testQuaternionDistance() {
    // Identical unit quaternions are 0 apart; opposite hemispheres too.
    const std::vector<MetricSample> same{{1.0, 1.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}};
    assert(nearlyEqual(metric::computeDistance(same, MetricKind::Quaternion), 0.0));
    const std::vector<MetricSample> flipped{{-1.0, 1.0}, {0.0, 0.0}, {0.0, 0.0}, {0.0, 0.0}};
    assert(nearlyEqual(metric::computeDistance(flipped, MetricKind::Quaternion), 0.0));
    // 180 degrees apart is the maximum distance 1.
    const std::vector<MetricSample> half{{1.0, 0.0}, {0.0, 1.0}, {0.0, 0.0}, {0.0, 0.0}};
    assert(nearlyEqual(metric::computeDistance(half, MetricKind::Quaternion), 1.0));
    // 90 degrees about X.
    const double h = std::sqrt(0.5);
    const std::vector<MetricSample> quarter{{1.0, h}, {0.0, h}, {0.0, 0.0}, {0.0, 0.0}};
    assert(nearlyEqual(metric::computeDistance(quarter, MetricKind::Quaternion), 0.5, 1e-9));
    // Arity is not checked.
    const double two = metric::computeDistance({{1.0, 1.0}, {0.0, 0.0}}, MetricKind::Quaternion);
    assert(nearlyEqual(two, 0.0));
}

void testMetricNames() {
    MetricKind kind = MetricKind::Absolute;
    assert(metric::parseMetric("EUCLIDEAN", kind) && kind == MetricKind::Euclidean);
    assert(metric::parseMetric("QUATERNION", kind) && kind == MetricKind::Quaternion);
    assert(!metric::parseMetric("euclidean", kind));
    assert(std::string(metric::metricName(MetricKind::Absolute)) == "ABSOLUTE");
}

void testPoseLiteral() {
    assert(synth::poseLiteral(1.0, 6) == "1.0");
    assert(synth::poseLiteral(0.5, 6) == "0.5");
    assert(synth::poseLiteral(0.123456789, 6) == "0.123457");
    assert(synth::poseLiteral(0.123456789, 3) == "0.123");
    assert(synth::poseLiteral(-0.7071067811865476, 4) == "-0.7071");
}

void testAbsoluteExpression() {
    const std::vector<synth::ExpressionSymbol> two{{"var0", "1.0"}, {"var1", "0.5"}};
    assert(synth::synthesizeExpression(two, MetricKind::Absolute) == "(fabs(var0-1.0)+fabs(var1-0.5))/2.0");
    const std::vector<synth::ExpressionSymbol> one{{"x", "0.25"}};
    assert(synth::synthesizeExpression(one, MetricKind::Absolute) == "fabs(x-0.25)");
}

void testEuclideanExpression() {
    const std::vector<synth::ExpressionSymbol> two{{"var0", "3.0"}, {"var1", "4.0"}};
    assert(synth::synthesizeExpression(two, MetricKind::Euclidean) == "sqrt(pow(var0-3.0,2.0)+pow(var1-4.0,2.0))");
}

void testQuaternionExpression() {
    const std::vector<synth::ExpressionSymbol> q{{"w", "1.0"}, {"x", "0.0"}, {"y", "0.0"}, {"z", "0.0"}};
    assert(synth::synthesizeExpression(q, MetricKind::Quaternion) ==
           "acos((2.0*pow(clamp(w*1.0+x*0.0+y*0.0+z*0.0,-1.0,1.0),2.0))-1.0)/pi");
}

void testZeroVariablesGiveConstant() {
    for (auto kind : {MetricKind::Absolute, MetricKind::Euclidean, MetricKind::Quaternion}) {
        assert(synth::synthesizeExpression({}, kind) == "1.0");
    }
}

void testCombinationExpressions() {
    const std::vector<int> slots{0, 2, 1};
    const auto mul = synth::synthesizeCombination(synth::ActivationMode::Multiply, "Body", "csk_abc", slots);
    assert(mul.type == host::DriverType::Scripted);
    assert(mul.expression == "d0*d1*d2");
    assert(mul.bindings.size() == 3);
    const auto& ref = std::get<host::PropertyRef>(mul.bindings[1].targets.front());
    assert(ref.idType == host::IdType::Mesh);
    assert(ref.object == "Body");
    assert(ref.dataPath == "[\"csk_abc\"][2]");
    assert(mul.bindings[1].name == "d1");

    const auto avg = synth::synthesizeCombination(synth::ActivationMode::Average, "Body", "csk_abc", slots);
    assert(avg.expression == "(d0+d1+d2)/3.0");

    const auto lo = synth::synthesizeCombination(synth::ActivationMode::Min, "Body", "csk_abc", slots);
    assert(lo.type == host::DriverType::Min);
    assert(lo.expression.empty());
    const auto hi = synth::synthesizeCombination(synth::ActivationMode::Max, "Body", "csk_abc", slots);
    assert(hi.type == host::DriverType::Max);

    assert(synth::synthesizeCombination(synth::ActivationMode::Multiply, "Body", "csk_abc", {}).expression == "1.0");
    assert(synth::synthesizeCombination(synth::ActivationMode::Average, "Body", "csk_abc", {}).expression == "0.0");
}

} // namespace

int main() {
    testAbsoluteDistance();
    testEuclideanDistance();
    testQuaternionDistance();
    testMetricNames();
    testPoseLiteral();
    testAbsoluteExpression();
    testEuclideanExpression();
    testQuaternionExpression();
    testZeroVariablesGiveConstant();
    testCombinationExpressions();
    return 0;
}
