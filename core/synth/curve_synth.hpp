#pragma once

#include "../curve/falloff_curve.hpp"
#include "../curve/keyframe.hpp"
#include "../metric/distance_metric.hpp"

#include <vector>

namespace cskit::core::synth {

/**
 * Two-key response curve mapping distance-from-pose to weight.
 *
 * Weight is 1 at distance 0 and 0 at the distance between the samples' rest
 * and pose values. Handles scale with that distance so the shape is the same
 * for every anchor. With no samples the fixed unit curve is returned. Keys are
 * bezier with free handles.
 */
curve::KeyframeCurve synthesizeResponseCurve(const std::vector<metric::MetricSample>& samples, metric::MetricKind kind);

// Falloff remapped onto [1-radius, 1] x [0, goal]; extrapolates linearly unless clamped.
curve::KeyframeCurve synthesizeFalloffCurve(const curve::FalloffCurve& falloff, double radius, double goal, bool clamp);

} // namespace cskit::core::synth
