#include "target.hpp"

#include "manager.hpp"
#include "../debug_log.hpp"
#include "../synth/curve_synth.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>

namespace cskit::core::model {

Target::Target(std::weak_ptr<Manager> owner, std::string identifier, const EngineConfig& config)
    : owner_(std::move(owner)),
      config_(config),
      identifier_(std::move(identifier)),
      activationMode_(config.defaultActivationMode),
      goal_(std::clamp(config.defaultGoal, 0.0, kMaxGoal)),
      radius_(std::clamp(config.defaultRadius, 0.0, 1.0)),
      clamp_(config.defaultClamp) {}

void Target::setName(const std::string& name) {
    if (name == name_) return;
    const std::string previous = name_;
    name_ = name;
    if (!previous.empty()) {
        const host::HostContext* ctx = host();
        if (ctx && ctx->channels) {
            ctx->channels->remove(host::ChannelAddress{host::ChannelOwner::ShapeKeys, host::shapeKeyValuePath(previous), -1});
        }
    }
    update();
}

void Target::setActivationMode(synth::ActivationMode mode) {
    activationMode_ = mode;
    update();
}

void Target::setGoal(double goal) {
    goal_ = std::clamp(goal, 0.0, kMaxGoal);
    fcurveUpdate();
}

void Target::setRadius(double radius) {
    radius_ = std::clamp(radius, 0.0, 1.0);
    fcurveUpdate();
}

void Target::setClamp(bool clamp) {
    clamp_ = clamp;
    fcurveUpdate();
}

void Target::setMute(bool mute) {
    mute_ = mute;
    driverUpdate();
}

void Target::editFalloff(const std::function<void(curve::FalloffCurve&)>& edit) {
    edit(falloff_);
    fcurveUpdate();
}

std::shared_ptr<Driver> Target::findDriver(const std::string& name) const {
    for (const auto& d : drivers_) {
        if (d->name() == name) return d;
    }
    return nullptr;
}

std::shared_ptr<Driver> Target::activeDriver() const {
    return activeDriverIndex < drivers_.size() ? drivers_[activeDriverIndex] : nullptr;
}

std::shared_ptr<Driver> Target::addDriver(const std::string& name) {
    std::set<int> used;
    for (const auto& d : drivers_) used.insert(d->arrayIndex());
    int slot = 0;
    while (used.count(slot)) ++slot;

    auto driver = std::make_shared<Driver>(weak_from_this(), "[\"" + arrayName() + "\"]", slot, config_);
    drivers_.push_back(driver);
    driver->setName(name.empty() ? config_.driverName : name);
    CSKIT_DBG_LOG("[cskit] target '%s' add driver '%s' slot=%d\n", name_.c_str(), driver->name().c_str(), slot);

    resizeArray();
    driver->update();
    update();
    return driver;
}

void Target::removeDriver(std::size_t index) {
    if (index >= drivers_.size()) {
        throw std::out_of_range("Target::removeDriver: index " + std::to_string(index) + " out of range 0-" +
                                std::to_string(drivers_.size()));
    }
    drivers_[index]->releaseChannel();
    drivers_.erase(drivers_.begin() + static_cast<std::ptrdiff_t>(index));
    if (activeDriverIndex > 0 && activeDriverIndex >= drivers_.size()) activeDriverIndex = drivers_.size() - 1;
    resizeArray();
    update();
}

void Target::moveDriver(std::size_t from, std::size_t to) {
    if (from >= drivers_.size() || to >= drivers_.size()) {
        throw std::out_of_range("Target::moveDriver: index out of range 0-" + std::to_string(drivers_.size()));
    }
    auto item = drivers_[from];
    drivers_.erase(drivers_.begin() + static_cast<std::ptrdiff_t>(from));
    drivers_.insert(drivers_.begin() + static_cast<std::ptrdiff_t>(to), item);
    driverUpdate();
}

const host::HostContext* Target::host() const {
    auto mgr = manager();
    return mgr ? &mgr->host() : nullptr;
}

std::string Target::dataPath() const {
    return name_.empty() ? std::string() : host::shapeKeyValuePath(name_);
}

host::ChannelAddress Target::channelAddress() const {
    return host::ChannelAddress{host::ChannelOwner::ShapeKeys, dataPath(), -1};
}

std::vector<int> Target::slots() const {
    std::vector<int> out;
    out.reserve(drivers_.size());
    for (const auto& d : drivers_) out.push_back(d->arrayIndex());
    return out;
}

bool Target::isValid() const {
    if (name_.empty()) return false;
    const host::HostContext* ctx = host();
    return ctx && ctx->shapeKeys && ctx->shapeKeys->hasShapeKey(name_);
}

curve::KeyframeCurve Target::activationCurve() const {
    return synth::synthesizeFalloffCurve(falloff_, radius_, goal_, clamp_);
}

host::ScriptedDriver Target::combinationDriver() const {
    const host::HostContext* ctx = host();
    return synth::synthesizeCombination(activationMode_, ctx ? ctx->meshName : std::string(), arrayName(), slots());
}

void Target::fcurveUpdate() {
    if (!isValid() || !host()->channels) {
        sync_ = SyncState::Dirty;
        return;
    }
    auto& channel = host()->channels->ensure(channelAddress());
    channel.curve = activationCurve();
    sync_ = SyncState::Clean;
}

void Target::driverUpdate() {
    if (!isValid() || !host()->channels) {
        sync_ = SyncState::Dirty;
        return;
    }
    auto& channel = host()->channels->ensure(channelAddress());
    channel.mute = mute_;
    channel.driver = combinationDriver();
    sync_ = SyncState::Clean;
}

void Target::update() {
    if (!isValid()) {
        CSKIT_DBG_LOG("[cskit] target '%s' is not valid, synthesis skipped\n", name_.c_str());
        sync_ = SyncState::Dirty;
        return;
    }
    fcurveUpdate();
    driverUpdate();
}

void Target::resizeArray() {
    const host::HostContext* ctx = host();
    if (!ctx || !ctx->arrays) return;
    int length = 0;
    for (const auto& d : drivers_) length = std::max(length, d->arrayIndex() + 1);
    ctx->arrays->assign(arrayName(), std::vector<double>(static_cast<std::size_t>(length), 0.0));
}

void Target::releaseChannels() {
    for (const auto& d : drivers_) d->releaseChannel();
    const host::HostContext* ctx = host();
    if (!ctx) return;
    if (ctx->channels && !name_.empty()) ctx->channels->remove(channelAddress());
    if (ctx->arrays) ctx->arrays->remove(arrayName());
    sync_ = SyncState::Dirty;
}

void Target::serialize(serde::Serializer& serializer) const {
    serializer.putKey("name");
    serializer.putValue(name_);
    serializer.putKey("identifier");
    serializer.putValue(identifier_);
    serializer.putKey("activation_mode");
    serializer.putValue(std::string(synth::activationModeName(activationMode_)));
    serializer.putKey("goal");
    serializer.putValue(goal_);
    serializer.putKey("radius");
    serializer.putValue(radius_);
    serializer.putKey("clamp");
    serializer.putValue(clamp_);
    serializer.putKey("mute");
    serializer.putValue(mute_);
    serializer.putKey("active_index");
    serializer.putValue(activeDriverIndex);
    serde::Serializer fs;
    falloff_.serialize(fs);
    serializer.putChild("falloff", fs);
    std::vector<serde::Serializer> items;
    for (const auto& d : drivers_) {
        serde::Serializer ds;
        d->serialize(ds);
        items.push_back(std::move(ds));
    }
    serializer.putList("drivers", items);
}

serde::SerdeException Target::deserializeFromFghj(const serde::Fghj& data) {
    try {
        if (auto v = data.get_optional<std::string>("name")) name_ = *v;
        if (auto v = data.get_optional<std::string>("identifier")) identifier_ = *v;
        if (identifier_.empty()) return std::string("target identifier is missing");
        if (auto v = data.get_optional<std::string>("activation_mode")) {
            if (!synth::parseActivationMode(*v, activationMode_)) return "unknown activation mode: " + *v;
        }
        if (auto v = data.get_optional<double>("goal")) goal_ = std::clamp(*v, 0.0, kMaxGoal);
        if (auto v = data.get_optional<double>("radius")) radius_ = std::clamp(*v, 0.0, 1.0);
        if (auto v = data.get_optional<bool>("clamp")) clamp_ = *v;
        if (auto v = data.get_optional<bool>("mute")) mute_ = *v;
        if (auto v = data.get_optional<std::size_t>("active_index")) activeDriverIndex = *v;
        if (auto f = data.get_child_optional("falloff")) {
            if (auto err = falloff_.deserializeFromFghj(*f)) return err;
        }
        drivers_.clear();
        if (auto list = data.get_child_optional("drivers")) {
            const std::string path = "[\"" + arrayName() + "\"]";
            std::set<int> used;
            for (const auto& item : *list) {
                auto driver = std::make_shared<Driver>(weak_from_this(), path, 0, config_);
                if (auto err = driver->deserializeFromFghj(item.second)) return err;
                if (driver->arrayIndex() < 0) {
                    return "negative array index " + std::to_string(driver->arrayIndex()) + " in target " + name_;
                }
                if (driver->dataPath() != path) {
                    return "driver data path " + driver->dataPath() + " does not address " + path;
                }
                if (!used.insert(driver->arrayIndex()).second) {
                    return "duplicate array index " + std::to_string(driver->arrayIndex()) + " in target " + name_;
                }
                drivers_.push_back(driver);
            }
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    sync_ = SyncState::Dirty;
    return std::nullopt;
}

} // namespace cskit::core::model
