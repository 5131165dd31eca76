#include "driver.hpp"

#include "target.hpp"
#include "../common/utils.hpp"
#include "../debug_log.hpp"
#include "../synth/curve_synth.hpp"
#include "../synth/expression_synth.hpp"

#include <algorithm>
#include <stdexcept>

namespace cskit::core::model {

Driver::Driver(std::weak_ptr<Target> owner, std::string dataPath, int arrayIndex, const EngineConfig& config)
    : owner_(std::move(owner)),
      name_(config.driverName),
      metricKind_(config.defaultMetric),
      precision_(std::clamp(config.defaultPrecision, kMinPrecision, kMaxPrecision)),
      arrayIndex_(arrayIndex),
      dataPath_(std::move(dataPath)),
      variableBase_(config.variableName),
      defaultPose_(config.defaultPoseValue),
      defaultRest_(config.defaultRestValue) {}

void Driver::setName(const std::string& name) {
    std::vector<std::string> taken;
    if (auto tgt = target()) {
        for (const auto& sibling : tgt->drivers()) {
            if (sibling.get() != this) taken.push_back(sibling->name());
        }
    }
    name_ = common::uniquify(name, taken);
}

void Driver::setMetricKind(metric::MetricKind kind) {
    metricKind_ = kind;
    update();
}

void Driver::setPrecision(int digits) {
    if (digits < kMinPrecision || digits > kMaxPrecision) {
        throw std::out_of_range("Driver::setPrecision: " + std::to_string(digits) + " outside [" +
                                std::to_string(kMinPrecision) + ", " + std::to_string(kMaxPrecision) + "]");
    }
    precision_ = digits;
    update();
}

const std::string& Driver::variableBase() const {
    if (!common::isIdentifier(variableBase_)) {
        throw std::invalid_argument("Driver::newVariable: variable name '" + variableBase_ + "' is not an identifier");
    }
    return variableBase_;
}

std::shared_ptr<Variable> Driver::newVariable() {
    auto variable = std::make_shared<Variable>(weak_from_this());
    std::vector<std::string> taken;
    for (const auto& v : variables_) taken.push_back(v->name());
    VariableState state = variable->state();
    state.name = common::nextSymbol(variableBase(), taken);
    state.poseValue = defaultPose_;
    state.restValue = defaultRest_;
    variable->restore(state);
    variables_.push_back(variable);
    update();
    return variable;
}

void Driver::removeVariable(std::size_t index) {
    if (index >= variables_.size()) {
        throw std::out_of_range("Driver::removeVariable: index " + std::to_string(index) + " out of range 0-" +
                                std::to_string(variables_.size()));
    }
    variables_.erase(variables_.begin() + static_cast<std::ptrdiff_t>(index));
    update();
}

void Driver::removeVariable(const std::shared_ptr<Variable>& variable) {
    auto it = std::find(variables_.begin(), variables_.end(), variable);
    if (it == variables_.end()) {
        throw std::invalid_argument("Driver::removeVariable: variable is not a member of driver '" + name_ + "'");
    }
    variables_.erase(it);
    update();
}

void Driver::appendVariables(const std::vector<VariableState>& states) {
    std::vector<std::string> taken;
    for (const auto& v : variables_) taken.push_back(v->name());
    for (const auto& state : states) {
        VariableState copy = state;
        if (!common::isIdentifier(copy.name)) copy.name = variableBase();
        if (std::find(taken.begin(), taken.end(), copy.name) != taken.end()) {
            const std::string stem = common::symbolStem(copy.name);
            copy.name = common::nextSymbol(stem.empty() ? variableBase() : stem, taken);
        }
        taken.push_back(copy.name);
        auto variable = std::make_shared<Variable>(weak_from_this());
        variable->restore(copy);
        variables_.push_back(variable);
    }
    update();
}

const host::HostContext* Driver::host() const {
    auto tgt = target();
    return tgt ? tgt->host() : nullptr;
}

host::ChannelAddress Driver::channelAddress() const {
    return host::ChannelAddress{host::ChannelOwner::Mesh, dataPath_, arrayIndex_};
}

std::vector<metric::MetricSample> Driver::samples() const {
    std::vector<metric::MetricSample> out;
    out.reserve(variables_.size());
    for (const auto& v : variables_) {
        out.push_back(metric::MetricSample{v->restValue(), common::roundToPrecision(v->poseValue(), precision_)});
    }
    return out;
}

double Driver::distance() const {
    return metric::computeDistance(samples(), metricKind_);
}

curve::KeyframeCurve Driver::responseCurve() const {
    return synth::synthesizeResponseCurve(samples(), metricKind_);
}

std::string Driver::expression() const {
    std::vector<synth::ExpressionSymbol> symbols;
    symbols.reserve(variables_.size());
    for (const auto& v : variables_) {
        symbols.push_back(synth::ExpressionSymbol{v->name(), synth::poseLiteral(v->poseValue(), precision_)});
    }
    return synth::synthesizeExpression(symbols, metricKind_);
}

host::ScriptedDriver Driver::scriptedDriver() const {
    host::ScriptedDriver out;
    out.type = host::DriverType::Scripted;
    out.expression = expression();
    for (const auto& v : variables_) out.bindings.push_back(v->binding());
    return out;
}

double Driver::liveDistance() const {
    std::vector<metric::MetricSample> live;
    live.reserve(variables_.size());
    for (const auto& v : variables_) {
        live.push_back(metric::MetricSample{v->value(), common::roundToPrecision(v->poseValue(), precision_)});
    }
    if (live.empty()) return 1.0;
    return metric::computeDistance(live, metricKind_);
}

double Driver::liveWeight() const {
    return responseCurve().evaluate(liveDistance());
}

void Driver::fcurveUpdate() {
    const host::HostContext* ctx = host();
    if (!ctx || !ctx->channels) return;
    auto& channel = ctx->channels->ensure(channelAddress());
    channel.curve = responseCurve();
    CSKIT_DBG_LOG("[cskit] driver '%s' curve anchor=%.17g\n", name_.c_str(), channel.curve.keyframes.back().co.x);
}

void Driver::driverUpdate() {
    const host::HostContext* ctx = host();
    if (!ctx || !ctx->channels) return;
    auto& channel = ctx->channels->ensure(channelAddress());
    channel.driver = scriptedDriver();
    CSKIT_DBG_LOG("[cskit] driver '%s' expression=%s\n", name_.c_str(), channel.driver.expression.c_str());
}

void Driver::update() {
    sync_ = SyncState::Dirty;
    const host::HostContext* ctx = host();
    if (!ctx || !ctx->channels) {
        CSKIT_DBG_LOG("[cskit] driver '%s' has no host, left dirty\n", name_.c_str());
        return;
    }
    fcurveUpdate();
    driverUpdate();
    sync_ = SyncState::Clean;
}

void Driver::releaseChannel() {
    const host::HostContext* ctx = host();
    if (!ctx || !ctx->channels) return;
    ctx->channels->remove(channelAddress());
    sync_ = SyncState::Dirty;
}

void Driver::serialize(serde::Serializer& serializer) const {
    serializer.putKey("name");
    serializer.putValue(name_);
    serializer.putKey("type");
    serializer.putValue(std::string(metric::metricName(metricKind_)));
    serializer.putKey("precision");
    serializer.putValue(precision_);
    serializer.putKey("array_index");
    serializer.putValue(arrayIndex_);
    serializer.putKey("data_path");
    serializer.putValue(dataPath_);
    serializer.putKey("show_expanded");
    serializer.putValue(showExpanded);
    std::vector<serde::Serializer> items;
    for (const auto& v : variables_) {
        serde::Serializer vs;
        v->state().serialize(vs);
        items.push_back(std::move(vs));
    }
    serializer.putList("variables", items);
}

serde::SerdeException Driver::deserializeFromFghj(const serde::Fghj& data) {
    try {
        if (auto v = data.get_optional<std::string>("name")) name_ = *v;
        if (auto v = data.get_optional<std::string>("type")) {
            if (!metric::parseMetric(*v, metricKind_)) return "unknown metric: " + *v;
        }
        if (auto v = data.get_optional<int>("precision")) precision_ = std::clamp(*v, kMinPrecision, kMaxPrecision);
        if (auto v = data.get_optional<int>("array_index")) arrayIndex_ = *v;
        if (auto v = data.get_optional<std::string>("data_path")) dataPath_ = *v;
        if (auto v = data.get_optional<bool>("show_expanded")) showExpanded = *v;
        variables_.clear();
        if (auto list = data.get_child_optional("variables")) {
            for (const auto& item : *list) {
                VariableState state;
                if (auto err = state.deserializeFromFghj(item.second)) return err;
                auto variable = std::make_shared<Variable>(weak_from_this());
                variable->restore(state);
                variables_.push_back(variable);
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    sync_ = SyncState::Dirty;
    return std::nullopt;
}

} // namespace cskit::core::model
