#include "../core/curve/falloff_curve.hpp"
#include "../core/curve/keyframe.hpp"
#include "../core/synth/curve_synth.hpp"

#include <cassert>
#include <cmath>
#include <stdexcept>

using namespace cskit::core::curve;
using namespace cskit::core;

namespace {

bool nearlyEqual(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) <= eps;
}

Keyframe key(Point co, Point hl, Point hr, Interpolation ip = Interpolation::Bezier) {
    Keyframe k;
    k.co = co;
    k.handleLeft = hl;
    k.handleRight = hr;
    k.interpolation = ip;
    return k;
}

void testExactValuesAtKeys() {
    KeyframeCurve curve({key({0.0, 1.0}, {-0.25, 1.0}, {0.25, 0.75}), key({2.0, 0.0}, {1.5, 0.25}, {2.5, 0.0})},
                        Extrapolation::Constant);
    assert(curve.evaluate(0.0) == 1.0);
    assert(curve.evaluate(2.0) == 0.0);
    assert(curve.evaluate(-5.0) == 1.0);
    assert(curve.evaluate(7.0) == 0.0);
}

void testLinearAndConstantSegments() {
    KeyframeCurve linear({key({0.0, 0.0}, {}, {}, Interpolation::Linear), key({4.0, 2.0}, {}, {}, Interpolation::Linear)},
                         Extrapolation::Linear);
    assert(nearlyEqual(linear.evaluate(1.0), 0.5, 1e-12));
    assert(nearlyEqual(linear.evaluate(-2.0), -1.0, 1e-12));
    assert(nearlyEqual(linear.evaluate(6.0), 3.0, 1e-12));

    KeyframeCurve stepped({key({0.0, 3.0}, {}, {}, Interpolation::Constant), key({1.0, 5.0}, {}, {}, Interpolation::Constant)},
                          Extrapolation::Constant);
    assert(stepped.evaluate(0.99) == 3.0);
    assert(stepped.evaluate(1.0) == 5.0);
}

void testBezierSolveIsMonotoneAndSymmetric() {
    KeyframeCurve curve({key({0.0, 1.0}, {-0.25, 1.0}, {0.25, 0.75}), key({1.0, 0.0}, {0.75, 0.25}, {1.25, 0.0})},
                        Extrapolation::Constant);
    assert(nearlyEqual(curve.evaluate(0.5), 0.5));
    double prev = curve.evaluate(0.0);
    for (int i = 1; i <= 20; ++i) {
        const double y = curve.evaluate(i / 20.0);
        assert(y <= prev + 1e-12);
        prev = y;
    }
    assert(nearlyEqual(curve.evaluate(0.25) + curve.evaluate(0.75), 1.0));
}

void testOvershootingHandlesAreCorrected() {
    // Handles reaching past the neighbouring key would make x non-monotone.
    KeyframeCurve curve({key({0.0, 0.0}, {-1.0, 0.0}, {3.0, 0.0}), key({1.0, 1.0}, {-2.0, 1.0}, {2.0, 1.0})},
                        Extrapolation::Constant);
    double prev = curve.evaluate(0.0);
    for (int i = 1; i <= 10; ++i) {
        const double y = curve.evaluate(i / 10.0);
        assert(std::isfinite(y));
        assert(y >= prev - 1e-9);
        prev = y;
    }
}

void testFalloffPresetsAndEditing() {
    FalloffCurve falloff;
    assert(falloff.size() == 2);
    assert(nearlyEqual(falloff.sample(0.0), 0.0));
    assert(nearlyEqual(falloff.sample(1.0), 1.0));
    assert(nearlyEqual(falloff.sample(0.3), 0.3));

    FalloffCurve easeIn(FalloffPreset::EaseIn);
    assert(easeIn.sample(0.25) < 0.25);
    FalloffCurve easeOut(FalloffPreset::EaseOut);
    assert(easeOut.sample(0.75) > 0.75);

    const std::size_t idx = falloff.insertPoint(0.5, 0.8);
    assert(idx == 1);
    assert(falloff.size() == 3);
    assert(nearlyEqual(falloff.sample(0.5), 0.8));

    // x is clamped between the neighbours.
    falloff.movePoint(1, 1.5, 0.2);
    assert(falloff.points()[1].co.x == 1.0);
    assert(falloff.points()[1].co.y == 0.2);
    falloff.movePoint(1, 0.4, 1.7);
    assert(falloff.points()[1].co.y == 1.0);

    falloff.setHandleType(1, FalloffHandle::Vector);
    assert(falloff.points()[1].handle == FalloffHandle::Vector);

    falloff.insertPoint(0.7, 0.7);
    bool threw = false;
    try {
        falloff.removePoint(3);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(falloff.size() == 4);
    falloff.removePoint(2);
    falloff.removePoint(1);
    assert(falloff.size() == 2);
    threw = false;
    try {
        falloff.removePoint(0);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    threw = false;
    try {
        falloff.movePoint(5, 0.0, 0.0);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    assert(threw);
}

void testAutoClampedFlattensExtrema() {
    FalloffCurve falloff;
    falloff.setPoints({{{0.0, 0.0}, FalloffHandle::AutoClamped},
                       {{0.5, 1.0}, FalloffHandle::AutoClamped},
                       {{1.0, 0.0}, FalloffHandle::AutoClamped}});
    const auto keys = falloff.keyframes();
    assert(keys[1].handleLeft.y == 1.0);
    assert(keys[1].handleRight.y == 1.0);
    assert(keys[0].handleRight.y == 0.0);
    for (int i = 0; i <= 10; ++i) assert(falloff.sample(i / 10.0) <= 1.0 + 1e-9);
}

void testFalloffRemapExtrapolatesUnlessClamped() {
    FalloffCurve falloff;
    falloff.setPoints({{{0.0, 0.0}, FalloffHandle::Auto}, {{1.0, 1.0}, FalloffHandle::Auto}});

    const KeyframeCurve open = synth::synthesizeFalloffCurve(falloff, 0.5, 2.0, false);
    assert(open.extrapolation == Extrapolation::Linear);
    assert(nearlyEqual(open.evaluate(0.5), 0.0, 1e-12));
    assert(nearlyEqual(open.evaluate(1.0), 2.0, 1e-12));
    assert(nearlyEqual(open.evaluate(0.75), 1.0));
    assert(nearlyEqual(open.evaluate(0.25), -1.0, 1e-9));
    assert(nearlyEqual(open.evaluate(1.25), 3.0, 1e-9));

    const KeyframeCurve held = synth::synthesizeFalloffCurve(falloff, 0.5, 2.0, true);
    assert(held.extrapolation == Extrapolation::Constant);
    assert(held.evaluate(0.25) == 0.0);
    assert(held.evaluate(0.0) == 0.0);
    assert(held.evaluate(1.25) == 2.0);
    assert(nearlyEqual(held.evaluate(0.75), 1.0));
}

void testResponseCurveAnchors() {
    using metric::MetricKind;
    using metric::MetricSample;
    const KeyframeCurve absolute = synth::synthesizeResponseCurve({{0.0, 1.0}, {0.0, 0.5}}, MetricKind::Absolute);
    assert(absolute.size() == 2);
    assert(absolute.keyframes[0].co == (Point{0.0, 1.0}));
    assert(absolute.keyframes[1].co == (Point{0.75, 0.0}));
    assert(absolute.keyframes[0].handleRight == (Point{0.1875, 0.75}));
    assert(absolute.keyframes[1].handleLeft == (Point{0.5625, 0.25}));
    assert(absolute.extrapolation == Extrapolation::Constant);

    const KeyframeCurve euclidean = synth::synthesizeResponseCurve({{0.0, 3.0}, {0.0, 4.0}}, MetricKind::Euclidean);
    assert(euclidean.keyframes[1].co == (Point{5.0, 0.0}));

    for (auto kind : {MetricKind::Absolute, MetricKind::Euclidean, MetricKind::Quaternion}) {
        const KeyframeCurve unit = synth::synthesizeResponseCurve({}, kind);
        assert(unit.keyframes[0].co == (Point{0.0, 1.0}));
        assert(unit.keyframes[1].co == (Point{1.0, 0.0}));
        assert(unit.keyframes[0].handleRight == (Point{0.25, 0.75}));
    }
}

} // namespace

int main() {
    testExactValuesAtKeys();
    testLinearAndConstantSegments();
    testBezierSolveIsMonotoneAndSymmetric();
    testOvershootingHandlesAreCorrected();
    testFalloffPresetsAndEditing();
    testAutoClampedFlattensExtrema();
    testFalloffRemapExtrapolatesUnlessClamped();
    testResponseCurveAnchors();
    return 0;
}
