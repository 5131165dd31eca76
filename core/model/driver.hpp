#pragma once

#include "variable.hpp"
#include "../config.hpp"
#include "../curve/keyframe.hpp"
#include "../host/host_context.hpp"
#include "../metric/distance_metric.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace cskit::core::model {

class Target;

enum class SyncState {
    Clean,
    Dirty,
};

/**
 * One distance metric over a list of variables.
 *
 * A driver owns one channel on the mesh, addressed by its fixed data path and
 * array index. The channel's curve maps the live distance from the recorded
 * pose to a weight in [0,1] and its scripted driver computes that distance.
 * Both are rebuilt together by update().
 */
class Driver : public std::enable_shared_from_this<Driver> {
public:
    Driver(std::weak_ptr<Target> owner, std::string dataPath, int arrayIndex, const EngineConfig& config);

    const std::string& name() const { return name_; }
    // Names are unique among the owning target's drivers ("<name>.001", ...).
    void setName(const std::string& name);

    metric::MetricKind metricKind() const { return metricKind_; }
    void setMetricKind(metric::MetricKind kind);

    int precision() const { return precision_; }
    // Throws std::out_of_range outside [kMinPrecision, kMaxPrecision].
    void setPrecision(int digits);

    int arrayIndex() const { return arrayIndex_; }
    const std::string& dataPath() const { return dataPath_; }

    bool showExpanded{false};

    const std::vector<std::shared_ptr<Variable>>& variables() const { return variables_; }
    std::shared_ptr<Variable> newVariable();
    // Throws std::out_of_range; nothing changes on failure.
    void removeVariable(std::size_t index);
    // Throws std::invalid_argument when `variable` does not belong to this driver.
    void removeVariable(const std::shared_ptr<Variable>& variable);
    // Appends copies of `states` and re-synthesizes once. Clashing names get a
    // numeric suffix.
    void appendVariables(const std::vector<VariableState>& states);

    std::shared_ptr<Target> target() const { return owner_.lock(); }
    const host::HostContext* host() const;
    host::ChannelAddress channelAddress() const;

    // (rest, rounded pose) per variable.
    std::vector<metric::MetricSample> samples() const;
    double distance() const;
    curve::KeyframeCurve responseCurve() const;
    std::string expression() const;
    host::ScriptedDriver scriptedDriver() const;

    // Distance and weight for the current live values.
    double liveDistance() const;
    double liveWeight() const;

    void fcurveUpdate();
    void driverUpdate();
    void update();
    // Removes this driver's channel from the store; absent channels are ignored.
    void releaseChannel();

    SyncState syncState() const { return sync_; }

    void serialize(serde::Serializer& serializer) const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

private:
    std::weak_ptr<Target> owner_{};
    std::string name_{};
    metric::MetricKind metricKind_{metric::MetricKind::Absolute};
    int precision_{6};
    int arrayIndex_{0};
    std::string dataPath_{};
    std::string variableBase_{"var"};

    // Throws std::invalid_argument when the configured base is not an identifier.
    const std::string& variableBase() const;
    double defaultPose_{1.0};
    double defaultRest_{0.0};
    std::vector<std::shared_ptr<Variable>> variables_{};
    SyncState sync_{SyncState::Dirty};
};

} // namespace cskit::core::model
