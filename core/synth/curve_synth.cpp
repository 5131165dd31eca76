#include "curve_synth.hpp"

#include "../debug_log.hpp"

namespace cskit::core::synth {

namespace {

curve::Keyframe freeBezierKey(curve::Point co, curve::Point hl, curve::Point hr) {
    curve::Keyframe key;
    key.co = co;
    key.handleLeft = hl;
    key.handleRight = hr;
    key.interpolation = curve::Interpolation::Bezier;
    key.handleLeftType = curve::HandleType::Free;
    key.handleRightType = curve::HandleType::Free;
    return key;
}

} // namespace

curve::KeyframeCurve synthesizeResponseCurve(const std::vector<metric::MetricSample>& samples, metric::MetricKind kind) {
    const double d = samples.empty() ? 1.0 : metric::computeDistance(samples, kind);
    CSKIT_DBG_LOG("[cskit] response curve anchor=%.17g samples=%zu\n", d, samples.size());

    std::vector<curve::Keyframe> keys;
    keys.reserve(2);
    if (samples.empty()) {
        keys.push_back(freeBezierKey({0.0, 1.0}, {-0.25, 1.0}, {0.25, 0.75}));
        keys.push_back(freeBezierKey({1.0, 0.0}, {0.75, 0.25}, {1.25, 0.0}));
    } else {
        keys.push_back(freeBezierKey({0.0, 1.0}, {-0.25, 1.0}, {d * 0.25, 0.75}));
        keys.push_back(freeBezierKey({d, 0.0}, {d * 0.75, 0.25}, {d * 1.25, 0.0}));
    }
    return curve::KeyframeCurve(std::move(keys), curve::Extrapolation::Constant);
}

curve::KeyframeCurve synthesizeFalloffCurve(const curve::FalloffCurve& falloff, double radius, double goal, bool clamp) {
    return falloff.toBezier(curve::Range{1.0 - radius, 1.0}, curve::Range{0.0, goal}, !clamp);
}

} // namespace cskit::core::synth
