#pragma once

#include <string>
#include <vector>

namespace cskit::core::metric {

enum class MetricKind {
    Absolute,
    Euclidean,
    Quaternion,
};

// One variable's contribution: `rest` is compared against `pose`.
struct MetricSample {
    double rest{0.0};
    double pose{0.0};
};

/**
 * Distance between the rest and pose values of a set of variables.
 *
 * Absolute is the mean absolute difference, Euclidean the L2 norm of the
 * differences and Quaternion treats the samples as the components of two unit
 * quaternions, returning their angular distance normalized to [0,1]. The
 * quaternion arity is not checked. An empty sample list yields 0.
 */
double computeDistance(const std::vector<MetricSample>& samples, MetricKind kind);

const char* metricName(MetricKind kind);
bool parseMetric(const std::string& name, MetricKind& out);

} // namespace cskit::core::metric
