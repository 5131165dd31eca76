#include "variable.hpp"

#include "driver.hpp"
#include "../common/utils.hpp"
#include "../debug_log.hpp"

#include <algorithm>
#include <stdexcept>
#include <type_traits>

namespace cskit::core::model {

namespace {

bool fitsKind(const host::TargetDescriptor& descriptor, VariableKind kind) {
    switch (kind) {
    case VariableKind::ShapeKey: return std::holds_alternative<host::ShapeKeyRef>(descriptor);
    case VariableKind::SingleProp: return std::holds_alternative<host::PropertyRef>(descriptor);
    case VariableKind::Transforms: return std::holds_alternative<host::TransformRef>(descriptor);
    case VariableKind::RotationDiff:
    case VariableKind::LocationDiff: return std::holds_alternative<host::ObjectRef>(descriptor);
    }
    return false;
}

std::string objectOf(const host::TargetDescriptor& descriptor) {
    return std::visit([](const auto& ref) -> std::string {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, host::DifferenceRef>) {
            return ref.a.object;
        } else {
            return ref.object;
        }
    }, descriptor);
}

host::TargetDescriptor withObject(host::TargetDescriptor descriptor, const std::string& object) {
    std::visit([&](auto& ref) {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, host::DifferenceRef>) {
            ref.a.object = object;
        } else {
            ref.object = object;
        }
    }, descriptor);
    return descriptor;
}

} // namespace

const char* variableKindName(VariableKind kind) {
    switch (kind) {
    case VariableKind::ShapeKey: return "SHAPEKEY";
    case VariableKind::SingleProp: return "SINGLE_PROP";
    case VariableKind::Transforms: return "TRANSFORMS";
    case VariableKind::RotationDiff: return "ROTATION_DIFF";
    case VariableKind::LocationDiff: return "LOC_DIFF";
    }
    return "SHAPEKEY";
}

bool parseVariableKind(const std::string& name, VariableKind& out) {
    for (auto k : {VariableKind::ShapeKey, VariableKind::SingleProp, VariableKind::Transforms,
                   VariableKind::RotationDiff, VariableKind::LocationDiff}) {
        if (name == variableKindName(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

host::TargetDescriptor defaultDescriptor(VariableKind kind) {
    switch (kind) {
    case VariableKind::ShapeKey: return host::ShapeKeyRef{};
    case VariableKind::SingleProp: return host::PropertyRef{};
    case VariableKind::Transforms: return host::TransformRef{};
    case VariableKind::RotationDiff:
    case VariableKind::LocationDiff: return host::ObjectRef{};
    }
    return host::ShapeKeyRef{};
}

void VariableState::serialize(serde::Serializer& serializer) const {
    serializer.putKey("name");
    serializer.putValue(name);
    serializer.putKey("type");
    serializer.putValue(std::string(variableKindName(kind)));
    serializer.putKey("rest_value");
    serializer.putValue(restValue);
    serializer.putKey("pose_value");
    serializer.putValue(poseValue);
    serializer.putKey("show_expanded");
    serializer.putValue(showExpanded);
    std::vector<serde::Serializer> items;
    for (const auto& target : targets) {
        serde::Serializer ts;
        host::serializeDescriptor(ts, target);
        items.push_back(std::move(ts));
    }
    serializer.putList("targets", items);
}

serde::SerdeException VariableState::deserializeFromFghj(const serde::Fghj& data) {
    try {
        if (auto v = data.get_optional<std::string>("name")) name = *v;
        if (auto v = data.get_optional<std::string>("type")) {
            if (!parseVariableKind(*v, kind)) return "unknown variable type: " + *v;
        }
        if (auto v = data.get_optional<double>("rest_value")) restValue = *v;
        if (auto v = data.get_optional<double>("pose_value")) poseValue = *v;
        if (auto v = data.get_optional<bool>("show_expanded")) showExpanded = *v;
        targets.clear();
        if (auto list = data.get_child_optional("targets")) {
            for (const auto& item : *list) {
                host::TargetDescriptor descriptor;
                if (auto err = host::deserializeDescriptor(item.second, descriptor)) return err;
                if (!fitsKind(descriptor, kind)) {
                    return std::string("target does not match variable type ") + variableKindName(kind);
                }
                targets.push_back(descriptor);
            }
        }
        if (targets.size() > targetCount(kind)) return std::string("too many targets for variable ") + name;
        while (targets.size() < targetCount(kind)) targets.push_back(defaultDescriptor(kind));
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

Variable::Variable(std::weak_ptr<Driver> owner) : owner_(std::move(owner)) {
    targets_.push_back(defaultDescriptor(kind_));
}

void Variable::setName(const std::string& name) {
    if (!common::isIdentifier(name)) {
        throw std::invalid_argument("Variable::setName: invalid name '" + name + "'");
    }
    if (name == name_) return;
    std::vector<std::string> taken;
    if (auto drv = driver()) {
        for (const auto& sibling : drv->variables()) {
            if (sibling.get() != this) taken.push_back(sibling->name());
        }
    }
    bool clash = std::find(taken.begin(), taken.end(), name) != taken.end();
    name_ = clash ? common::nextSymbol(common::symbolStem(name), taken) : name;
    notifyOwner();
}

void Variable::setKind(VariableKind kind) {
    if (kind == kind_) return;
    std::vector<host::TargetDescriptor> next;
    for (std::size_t i = 0; i < targetCount(kind); ++i) {
        if (i < targets_.size() && fitsKind(targets_[i], kind)) {
            next.push_back(targets_[i]);
        } else if (i < targets_.size()) {
            next.push_back(withObject(defaultDescriptor(kind), objectOf(targets_[i])));
        } else {
            next.push_back(defaultDescriptor(kind));
        }
    }
    kind_ = kind;
    targets_ = std::move(next);
    notifyOwner();
}

void Variable::setRestValue(double value) {
    restValue_ = value;
    notifyOwner();
}

void Variable::setPoseValue(double value) {
    poseValue_ = value;
    notifyOwner();
}

void Variable::setTarget(std::size_t index, const host::TargetDescriptor& descriptor) {
    if (index >= targets_.size()) {
        throw std::out_of_range("Variable::setTarget: index " + std::to_string(index) + " out of range");
    }
    if (!fitsKind(descriptor, kind_)) {
        throw std::invalid_argument(std::string("Variable::setTarget: descriptor does not fit ") + variableKindName(kind_));
    }
    targets_[index] = descriptor;
    notifyOwner();
}

host::TargetDescriptor Variable::resolvable() const {
    if (kind_ == VariableKind::RotationDiff || kind_ == VariableKind::LocationDiff) {
        host::DifferenceRef diff;
        diff.kind = kind_ == VariableKind::RotationDiff ? host::DifferenceKind::Rotation : host::DifferenceKind::Location;
        diff.a = std::get<host::ObjectRef>(targets_.at(0));
        diff.b = std::get<host::ObjectRef>(targets_.at(1));
        return diff;
    }
    return targets_.at(0);
}

double Variable::value() const {
    auto drv = driver();
    const host::HostContext* host = drv ? drv->host() : nullptr;
    if (!host || !host->values) return 0.0;
    return host->values->resolve(resolvable()).value_or(0.0);
}

host::DriverBinding Variable::binding() const {
    host::DriverBinding out;
    out.name = name_;
    switch (kind_) {
    case VariableKind::ShapeKey: {
        const auto& ref = std::get<host::ShapeKeyRef>(targets_.at(0));
        out.kind = host::BindingKind::SingleProp;
        out.targets.push_back(host::PropertyRef{host::IdType::Key, ref.object, host::shapeKeyValuePath(ref.shape)});
        break;
    }
    case VariableKind::SingleProp:
        out.kind = host::BindingKind::SingleProp;
        out.targets.push_back(targets_.at(0));
        break;
    case VariableKind::Transforms:
        out.kind = host::BindingKind::Transforms;
        out.targets.push_back(targets_.at(0));
        break;
    case VariableKind::RotationDiff:
    case VariableKind::LocationDiff:
        out.kind = kind_ == VariableKind::RotationDiff ? host::BindingKind::RotationDiff : host::BindingKind::LocationDiff;
        out.targets = targets_;
        break;
    }
    return out;
}

VariableState Variable::state() const {
    return VariableState{name_, kind_, targets_, restValue_, poseValue_, showExpanded};
}

void Variable::restore(const VariableState& state) {
    name_ = state.name;
    kind_ = state.kind;
    targets_ = state.targets;
    targets_.resize(targetCount(kind_), defaultDescriptor(kind_));
    restValue_ = state.restValue;
    poseValue_ = state.poseValue;
    showExpanded = state.showExpanded;
}

void Variable::notifyOwner() {
    if (auto drv = driver()) {
        CSKIT_DBG_LOG("[cskit] variable '%s' changed, updating driver '%s'\n", name_.c_str(), drv->name().c_str());
        drv->update();
    }
}

} // namespace cskit::core::model
