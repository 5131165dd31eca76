#include "operators.hpp"

#include "../common/utils.hpp"
#include "../debug_log.hpp"

#include <exception>
#include <utility>

namespace cskit::core::ops {

namespace {

OpResult finished() {
    return OpResult{OpStatus::Finished, {}};
}

OpResult cancel(Session& session, const std::string& message) {
    session.report(ReportLevel::Error, message);
    return OpResult{OpStatus::Cancelled, message};
}

// Runs an operator body, turning model exceptions into a cancelled result.
template <typename Fn>
OpResult run(Session& session, const char* name, Fn&& body) {
    CSKIT_DBG_LOG("[cskit] op %s\n", name);
    try {
        return body();
    } catch (const std::exception& e) {
        return cancel(session, std::string(name) + ": " + e.what());
    }
}

double capture(const host::HostContext* ctx, const host::TargetDescriptor& descriptor) {
    if (!ctx || !ctx->values) return 0.0;
    return ctx->values->resolve(descriptor).value_or(0.0);
}

template <typename E>
E offset(E base, int n) {
    return static_cast<E>(static_cast<int>(base) + n);
}

model::VariableState makeVariable(std::string name, model::VariableKind kind, host::TargetDescriptor descriptor,
                                  double rest, double pose) {
    model::VariableState state;
    state.name = std::move(name);
    state.kind = kind;
    state.targets.push_back(std::move(descriptor));
    state.restValue = rest;
    state.poseValue = pose;
    return state;
}

void addShapeKeyDriver(const Session& session, model::Target& target, const std::string& key) {
    const host::HostContext* ctx = target.host();
    const std::string mesh = ctx ? ctx->meshName : std::string();
    double pose = 0.0;
    if (ctx && ctx->shapeKeys) pose = ctx->shapeKeys->shapeKeyValue(key).value_or(0.0);
    auto driver = target.addDriver(key);
    driver->appendVariables({makeVariable(common::nextSymbol(session.config().variableName, {}),
                                          model::VariableKind::ShapeKey, host::ShapeKeyRef{mesh, key},
                                          session.config().defaultRestValue, pose)});
}

bool isEuler(RotationChannelMode mode) {
    switch (mode) {
    case RotationChannelMode::Auto:
    case RotationChannelMode::XYZ:
    case RotationChannelMode::XZY:
    case RotationChannelMode::YXZ:
    case RotationChannelMode::YZX:
    case RotationChannelMode::ZXY:
    case RotationChannelMode::ZYX: return true;
    default: return false;
    }
}

host::RotationMode eulerMode(RotationChannelMode mode) {
    switch (mode) {
    case RotationChannelMode::XYZ: return host::RotationMode::XYZ;
    case RotationChannelMode::XZY: return host::RotationMode::XZY;
    case RotationChannelMode::YXZ: return host::RotationMode::YXZ;
    case RotationChannelMode::YZX: return host::RotationMode::YZX;
    case RotationChannelMode::ZXY: return host::RotationMode::ZXY;
    case RotationChannelMode::ZYX: return host::RotationMode::ZYX;
    default: return host::RotationMode::Auto;
    }
}

} // namespace

OpResult targetAdd(Session& session, model::Manager& manager, const std::string& name,
                   const std::vector<std::string>& driverShapeKeys, bool useExisting) {
    return run(session, "targetAdd", [&]() -> OpResult {
        const host::HostContext& ctx = manager.host();
        if (!ctx.shapeKeys) return cancel(session, "Mesh has no shape keys.");
        if (name.empty()) return cancel(session, "A target shape key name is required.");
        if (useExisting && !ctx.shapeKeys->hasShapeKey(name)) {
            return cancel(session, "Shape key '" + name + "' not found.");
        }
        if (!useExisting && ctx.shapeKeys->hasShapeKey(name)) {
            return cancel(session, "Shape key '" + name + "' already exists.");
        }
        if (manager.findTarget(name)) {
            return cancel(session, "Shape key '" + name + "' is already a combination shape key.");
        }
        for (const auto& key : driverShapeKeys) {
            if (key != name && !ctx.shapeKeys->hasShapeKey(key)) {
                return cancel(session, "Shape key '" + key + "' not found.");
            }
        }
        if (!useExisting && !ctx.shapeKeys->addShapeKey(name)) {
            return cancel(session, "Could not create shape key '" + name + "'.");
        }

        auto target = manager.addTarget(name);
        for (const auto& key : driverShapeKeys) {
            if (key == name) continue;
            addShapeKeyDriver(session, *target, key);
        }
        target->update();
        manager.setActiveIndex(manager.size() - 1);
        return finished();
    });
}

OpResult targetRemove(Session& session, model::Manager& manager) {
    return run(session, "targetRemove", [&]() -> OpResult {
        if (!manager.active()) return cancel(session, "No active combination shape key.");
        manager.removeTarget(manager.activeIndex());
        return finished();
    });
}

OpResult targetMoveUp(Session& session, model::Manager& manager) {
    return run(session, "targetMoveUp", [&]() -> OpResult {
        if (!manager.active()) return cancel(session, "No active combination shape key.");
        const std::size_t index = manager.activeIndex();
        if (index == 0) return cancel(session, "Combination shape key is already first.");
        manager.moveTarget(index, index - 1);
        manager.setActiveIndex(index - 1);
        return finished();
    });
}

OpResult targetMoveDown(Session& session, model::Manager& manager) {
    return run(session, "targetMoveDown", [&]() -> OpResult {
        if (!manager.active()) return cancel(session, "No active combination shape key.");
        const std::size_t index = manager.activeIndex();
        if (index + 1 >= manager.size()) return cancel(session, "Combination shape key is already last.");
        manager.moveTarget(index, index + 1);
        manager.setActiveIndex(index + 1);
        return finished();
    });
}

OpResult driverAddShapeKeys(Session& session, model::Target& target, const std::vector<std::string>& shapeKeys) {
    return run(session, "driverAddShapeKeys", [&]() -> OpResult {
        const host::HostContext* ctx = target.host();
        if (shapeKeys.empty()) return cancel(session, "No shape keys selected.");
        if (!ctx || !ctx->shapeKeys) return cancel(session, "Mesh has no shape keys.");
        for (const auto& key : shapeKeys) {
            if (key == target.name()) return cancel(session, "A combination shape key cannot drive itself.");
            if (!ctx->shapeKeys->hasShapeKey(key)) return cancel(session, "Shape key '" + key + "' not found.");
        }
        for (const auto& key : shapeKeys) addShapeKeyDriver(session, target, key);
        target.activeDriverIndex = target.drivers().size() - 1;
        return finished();
    });
}

OpResult driverAddTransform(Session& session, model::Target& target, const TransformRequest& request) {
    return run(session, "driverAddTransform", [&]() -> OpResult {
        if (request.object.empty()) return cancel(session, "No object selected.");
        const host::HostContext* ctx = target.host();
        const double rest = session.config().defaultRestValue;
        std::vector<model::VariableState> vars;
        metric::MetricKind kind = session.config().defaultMetric;

        auto add = [&](const std::string& name, host::TransformType type, host::RotationMode mode) {
            host::TransformRef ref{request.object, request.bone, type, mode, request.space};
            vars.push_back(makeVariable(name, model::VariableKind::Transforms, ref, rest, capture(ctx, ref)));
        };
        auto addAxes = [&](host::TransformType first, host::RotationMode mode) {
            for (int i = 0; i < 3; ++i) {
                if (request.axes[static_cast<std::size_t>(i)]) add(std::string(1, "xyz"[i]), offset(first, i), mode);
            }
        };

        if (request.channel == TransformChannel::Location || request.channel == TransformChannel::Scale) {
            kind = metric::MetricKind::Euclidean;
            addAxes(request.channel == TransformChannel::Location ? host::TransformType::LocX : host::TransformType::ScaleX,
                    host::RotationMode::Auto);
        } else if (request.rotationMode == RotationChannelMode::Quaternion) {
            kind = metric::MetricKind::Quaternion;
            for (int i = 0; i < 4; ++i) {
                add(std::string(1, "wxyz"[i]), offset(host::TransformType::RotW, i), host::RotationMode::Quaternion);
            }
        } else if (isEuler(request.rotationMode)) {
            addAxes(host::TransformType::RotX, eulerMode(request.rotationMode));
        } else {
            const bool swing = request.rotationMode == RotationChannelMode::SwingX ||
                               request.rotationMode == RotationChannelMode::SwingY ||
                               request.rotationMode == RotationChannelMode::SwingZ;
            const int axis = swing ? static_cast<int>(request.rotationMode) - static_cast<int>(RotationChannelMode::SwingX)
                                   : static_cast<int>(request.rotationMode) - static_cast<int>(RotationChannelMode::TwistX);
            const auto mode = offset(host::RotationMode::SwingTwistX, axis);
            add(std::string(1, "xyz"[axis]), swing ? host::TransformType::RotW : offset(host::TransformType::RotX, axis), mode);
        }

        if (vars.empty()) return cancel(session, "No transform channels selected.");

        auto driver = target.addDriver();
        driver->setMetricKind(kind);
        driver->appendVariables(vars);
        target.activeDriverIndex = target.drivers().size() - 1;
        return finished();
    });
}

OpResult driverAddProperty(Session& session, model::Target& target, host::IdType idType, const std::string& object,
                           const std::string& dataPath) {
    return run(session, "driverAddProperty", [&]() -> OpResult {
        if (object.empty()) return cancel(session, "No object selected.");
        if (dataPath.empty()) return cancel(session, "No property path given.");
        host::PropertyRef ref{idType, object, dataPath};
        auto driver = target.addDriver();
        driver->appendVariables({makeVariable(common::nextSymbol(session.config().variableName, {}),
                                              model::VariableKind::SingleProp, ref, session.config().defaultRestValue,
                                              capture(target.host(), ref))});
        target.activeDriverIndex = target.drivers().size() - 1;
        return finished();
    });
}

OpResult driverAddDifference(Session& session, model::Target& target, host::DifferenceKind kind,
                             const host::ObjectRef& a, const host::ObjectRef& b) {
    return run(session, "driverAddDifference", [&]() -> OpResult {
        if (a.object.empty() || b.object.empty()) return cancel(session, "Two objects are required.");
        const auto varKind = kind == host::DifferenceKind::Rotation ? model::VariableKind::RotationDiff
                                                                    : model::VariableKind::LocationDiff;
        model::VariableState state = makeVariable(common::nextSymbol(session.config().variableName, {}), varKind, a,
                                                  session.config().defaultRestValue,
                                                  capture(target.host(), host::DifferenceRef{kind, a, b}));
        state.targets.push_back(b);
        auto driver = target.addDriver();
        driver->appendVariables({state});
        target.activeDriverIndex = target.drivers().size() - 1;
        return finished();
    });
}

OpResult driverRemove(Session& session, model::Target& target) {
    return run(session, "driverRemove", [&]() -> OpResult {
        if (!target.activeDriver()) return cancel(session, "No active driver.");
        target.removeDriver(target.activeDriverIndex);
        return finished();
    });
}

OpResult driverMoveUp(Session& session, model::Target& target) {
    return run(session, "driverMoveUp", [&]() -> OpResult {
        if (!target.activeDriver()) return cancel(session, "No active driver.");
        if (target.activeDriverIndex == 0) return cancel(session, "Driver is already first.");
        target.moveDriver(target.activeDriverIndex, target.activeDriverIndex - 1);
        target.activeDriverIndex -= 1;
        return finished();
    });
}

OpResult driverMoveDown(Session& session, model::Target& target) {
    return run(session, "driverMoveDown", [&]() -> OpResult {
        if (!target.activeDriver()) return cancel(session, "No active driver.");
        if (target.activeDriverIndex + 1 >= target.drivers().size()) return cancel(session, "Driver is already last.");
        target.moveDriver(target.activeDriverIndex, target.activeDriverIndex + 1);
        target.activeDriverIndex += 1;
        return finished();
    });
}

OpResult variableAdd(Session& session, model::Driver& driver) {
    return run(session, "variableAdd", [&]() -> OpResult {
        driver.newVariable();
        return finished();
    });
}

OpResult variableRemove(Session& session, model::Driver& driver, std::size_t index) {
    return run(session, "variableRemove", [&]() -> OpResult {
        if (index >= driver.variables().size()) return cancel(session, "Index out of range.");
        driver.removeVariable(index);
        return finished();
    });
}

OpResult variableCaptureValue(Session& session, model::Driver& driver, std::size_t index, CaptureSlot slot) {
    return run(session, "variableCaptureValue", [&]() -> OpResult {
        if (index >= driver.variables().size()) return cancel(session, "Index out of range.");
        const auto& variable = driver.variables()[index];
        const double value = variable->value();
        if (slot == CaptureSlot::Rest) {
            variable->setRestValue(value);
        } else {
            variable->setPoseValue(value);
        }
        return finished();
    });
}

OpResult variablesCopy(Session& session, const model::Driver& driver) {
    return run(session, "variablesCopy", [&]() -> OpResult {
        auto& clipboard = session.variableClipboard();
        clipboard.clear();
        std::vector<model::VariableState> items;
        for (const auto& v : driver.variables()) items.push_back(v->state());
        clipboard.store(std::move(items));
        return finished();
    });
}

OpResult variablesPaste(Session& session, model::Driver& driver) {
    return run(session, "variablesPaste", [&]() -> OpResult {
        const auto& clipboard = session.variableClipboard();
        if (clipboard.empty()) return cancel(session, "Nothing to paste.");
        driver.appendVariables(clipboard.items());
        return finished();
    });
}

OpResult curveCopy(Session& session, const model::Target& target) {
    return run(session, "curveCopy", [&]() -> OpResult {
        session.curveClipboard().store(target.falloff());
        return finished();
    });
}

OpResult curvePaste(Session& session, model::Target& target) {
    return run(session, "curvePaste", [&]() -> OpResult {
        const auto& stored = session.curveClipboard().curve();
        if (!stored) return cancel(session, "Nothing to paste.");
        const curve::FalloffCurve copy = *stored;
        target.editFalloff([&](curve::FalloffCurve& falloff) { falloff = copy; });
        return finished();
    });
}

} // namespace cskit::core::ops
