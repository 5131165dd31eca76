#include "distance_metric.hpp"

#include "../debug_log.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace cskit::core::metric {

double computeDistance(const std::vector<MetricSample>& samples, MetricKind kind) {
    if (samples.empty()) return 0.0;

    switch (kind) {
    case MetricKind::Quaternion: {
        if (samples.size() != 4) {
            CSKIT_DBG_LOG("[cskit] quaternion metric over %zu samples\n", samples.size());
        }
        double sum = 0.0;
        for (const auto& s : samples) sum += s.rest * s.pose;
        const double d = std::clamp(sum, -1.0, 1.0);
        return std::acos((2.0 * std::pow(d, 2.0)) - 1.0) / std::numbers::pi;
    }
    case MetricKind::Euclidean: {
        double sum = 0.0;
        for (const auto& s : samples) sum += std::pow(s.rest - s.pose, 2.0);
        return std::sqrt(sum);
    }
    case MetricKind::Absolute:
        break;
    }
    double sum = 0.0;
    for (const auto& s : samples) sum += std::fabs(s.rest - s.pose);
    return sum / static_cast<double>(samples.size());
}

const char* metricName(MetricKind kind) {
    switch (kind) {
    case MetricKind::Absolute: return "ABSOLUTE";
    case MetricKind::Euclidean: return "EUCLIDEAN";
    case MetricKind::Quaternion: return "QUATERNION";
    }
    return "ABSOLUTE";
}

bool parseMetric(const std::string& name, MetricKind& out) {
    for (auto k : {MetricKind::Absolute, MetricKind::Euclidean, MetricKind::Quaternion}) {
        if (name == metricName(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

} // namespace cskit::core::metric
