#include "config.hpp"

#include "common/utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace cskit::core {

void EngineConfig::serialize(serde::Serializer& serializer) const {
    serializer.putKey("precision");
    serializer.putValue(defaultPrecision);
    serializer.putKey("metric");
    serializer.putValue(std::string(metric::metricName(defaultMetric)));
    serializer.putKey("activation_mode");
    serializer.putValue(std::string(synth::activationModeName(defaultActivationMode)));
    serializer.putKey("goal");
    serializer.putValue(defaultGoal);
    serializer.putKey("radius");
    serializer.putValue(defaultRadius);
    serializer.putKey("clamp");
    serializer.putValue(defaultClamp);
    serializer.putKey("variable_name");
    serializer.putValue(variableName);
    serializer.putKey("driver_name");
    serializer.putValue(driverName);
    serializer.putKey("pose_value");
    serializer.putValue(defaultPoseValue);
    serializer.putKey("rest_value");
    serializer.putValue(defaultRestValue);
}

serde::SerdeException EngineConfig::deserializeFromFghj(const serde::Fghj& data) {
    try {
        if (auto v = data.get_optional<int>("precision")) defaultPrecision = std::clamp(*v, kMinPrecision, kMaxPrecision);
        if (auto v = data.get_optional<std::string>("metric")) {
            if (!metric::parseMetric(*v, defaultMetric)) return "unknown metric: " + *v;
        }
        if (auto v = data.get_optional<std::string>("activation_mode")) {
            if (!synth::parseActivationMode(*v, defaultActivationMode)) return "unknown activation mode: " + *v;
        }
        if (auto v = data.get_optional<double>("goal")) defaultGoal = std::clamp(*v, 0.0, kMaxGoal);
        if (auto v = data.get_optional<double>("radius")) defaultRadius = std::clamp(*v, 0.0, 1.0);
        if (auto v = data.get_optional<bool>("clamp")) defaultClamp = *v;
        if (auto v = data.get_optional<std::string>("variable_name")) {
            if (!common::isIdentifier(*v)) return "variable_name is not an identifier: '" + *v + "'";
            variableName = *v;
        }
        if (auto v = data.get_optional<std::string>("driver_name")) {
            if (v->empty()) return std::string("driver_name must not be empty");
            driverName = *v;
        }
        if (auto v = data.get_optional<double>("pose_value")) defaultPoseValue = *v;
        if (auto v = data.get_optional<double>("rest_value")) defaultRestValue = *v;
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

EngineConfig loadConfigFromString(const std::string& json) {
    std::stringstream ss(json);
    serde::Fghj pt;
    boost::property_tree::read_json(ss, pt);
    EngineConfig config;
    if (auto err = config.deserializeFromFghj(pt)) {
        throw std::runtime_error("Invalid engine config: " + *err);
    }
    return config;
}

EngineConfig loadConfig(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("Failed to open engine config: " + path);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadConfigFromString(buffer.str());
}

} // namespace cskit::core
