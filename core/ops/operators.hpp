#pragma once

#include "session.hpp"
#include "../host/descriptor.hpp"
#include "../model/driver.hpp"
#include "../model/manager.hpp"
#include "../model/target.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace cskit::core::ops {

enum class OpStatus {
    Finished,
    Cancelled,
};

struct OpResult {
    OpStatus status{OpStatus::Finished};
    std::string message{};

    bool finished() const { return status == OpStatus::Finished; }
};

enum class TransformChannel {
    Location,
    Rotation,
    Scale,
};

enum class RotationChannelMode {
    Auto,
    XYZ,
    XZY,
    YXZ,
    YZX,
    ZXY,
    ZYX,
    Quaternion,
    SwingX,
    SwingY,
    SwingZ,
    TwistX,
    TwistY,
    TwistZ,
};

struct TransformRequest {
    std::string object{};
    std::string bone{};
    host::TransformSpace space{host::TransformSpace::World};
    TransformChannel channel{TransformChannel::Location};
    RotationChannelMode rotationMode{RotationChannelMode::Auto};
    std::array<bool, 3> axes{false, false, false};
};

enum class CaptureSlot {
    Rest,
    Pose,
};

// Operators never throw; failures are reported through the session and leave
// the document unchanged.

OpResult targetAdd(Session& session, model::Manager& manager, const std::string& name,
                   const std::vector<std::string>& driverShapeKeys, bool useExisting);
OpResult targetRemove(Session& session, model::Manager& manager);
OpResult targetMoveUp(Session& session, model::Manager& manager);
OpResult targetMoveDown(Session& session, model::Manager& manager);

OpResult driverAddShapeKeys(Session& session, model::Target& target, const std::vector<std::string>& shapeKeys);
OpResult driverAddTransform(Session& session, model::Target& target, const TransformRequest& request);
OpResult driverAddProperty(Session& session, model::Target& target, host::IdType idType, const std::string& object,
                           const std::string& dataPath);
OpResult driverAddDifference(Session& session, model::Target& target, host::DifferenceKind kind,
                             const host::ObjectRef& a, const host::ObjectRef& b);
OpResult driverRemove(Session& session, model::Target& target);
OpResult driverMoveUp(Session& session, model::Target& target);
OpResult driverMoveDown(Session& session, model::Target& target);

OpResult variableAdd(Session& session, model::Driver& driver);
OpResult variableRemove(Session& session, model::Driver& driver, std::size_t index);
OpResult variableCaptureValue(Session& session, model::Driver& driver, std::size_t index, CaptureSlot slot);
OpResult variablesCopy(Session& session, const model::Driver& driver);
OpResult variablesPaste(Session& session, model::Driver& driver);

OpResult curveCopy(Session& session, const model::Target& target);
OpResult curvePaste(Session& session, model::Target& target);

} // namespace cskit::core::ops
