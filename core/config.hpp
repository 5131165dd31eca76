#pragma once

#include "metric/distance_metric.hpp"
#include "serde.hpp"
#include "synth/combination.hpp"

#include <string>

namespace cskit::core {

inline constexpr int kMinPrecision = 3;
inline constexpr int kMaxPrecision = 28;
inline constexpr double kMaxGoal = 10.0;

// Defaults applied to newly created targets, drivers and variables.
struct EngineConfig {
    int defaultPrecision{6};
    metric::MetricKind defaultMetric{metric::MetricKind::Absolute};
    synth::ActivationMode defaultActivationMode{synth::ActivationMode::Multiply};
    double defaultGoal{1.0};
    double defaultRadius{1.0};
    bool defaultClamp{true};
    std::string variableName{"var"};
    std::string driverName{"Driver"};
    double defaultPoseValue{1.0};
    double defaultRestValue{0.0};

    void serialize(serde::Serializer& serializer) const;
    // Missing keys keep their current value; out-of-range values are clamped.
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

EngineConfig loadConfig(const std::string& path);
EngineConfig loadConfigFromString(const std::string& json);

} // namespace cskit::core
