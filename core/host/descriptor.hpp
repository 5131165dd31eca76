#pragma once

#include "../serde.hpp"

#include <string>
#include <variant>

namespace cskit::core::host {

enum class IdType {
    Object,
    Mesh,
    Curve,
    Meta,
    Font,
    Volume,
    GreasePencil,
    Armature,
    Lattice,
    Light,
    LightProbe,
    Camera,
    Speaker,
    Key,
};

enum class TransformType {
    LocX,
    LocY,
    LocZ,
    RotW,
    RotX,
    RotY,
    RotZ,
    ScaleX,
    ScaleY,
    ScaleZ,
    ScaleAvg,
};

enum class RotationMode {
    Auto,
    XYZ,
    XZY,
    YXZ,
    YZX,
    ZXY,
    ZYX,
    Quaternion,
    SwingTwistX,
    SwingTwistY,
    SwingTwistZ,
};

enum class TransformSpace {
    World,
    Transform,
    Local,
};

enum class DifferenceKind {
    Rotation,
    Location,
};

// A shape key's value on the named object's mesh.
struct ShapeKeyRef {
    std::string object{};
    std::string shape{};

    bool operator==(const ShapeKeyRef&) const = default;
};

// A float property reached through `dataPath` from an ID of type `idType`.
struct PropertyRef {
    IdType idType{IdType::Object};
    std::string object{};
    std::string dataPath{};

    bool operator==(const PropertyRef&) const = default;
};

// One channel of an object's or bone's final transform.
struct TransformRef {
    std::string object{};
    std::string bone{};
    TransformType type{TransformType::LocX};
    RotationMode rotationMode{RotationMode::Auto};
    TransformSpace space{TransformSpace::World};

    bool operator==(const TransformRef&) const = default;
};

// One side of a difference measurement.
struct ObjectRef {
    std::string object{};
    std::string bone{};
    TransformSpace space{TransformSpace::World};

    bool operator==(const ObjectRef&) const = default;
};

// Angle or distance between two objects/bones.
struct DifferenceRef {
    DifferenceKind kind{DifferenceKind::Rotation};
    ObjectRef a{};
    ObjectRef b{};

    bool operator==(const DifferenceRef&) const = default;
};

using TargetDescriptor = std::variant<ShapeKeyRef, PropertyRef, TransformRef, ObjectRef, DifferenceRef>;

// Path of a shape key's value relative to its Key datablock.
std::string shapeKeyValuePath(const std::string& shape);

const char* idTypeName(IdType v);
bool parseIdType(const std::string& name, IdType& out);
const char* transformTypeName(TransformType v);
bool parseTransformType(const std::string& name, TransformType& out);
const char* rotationModeName(RotationMode v);
bool parseRotationMode(const std::string& name, RotationMode& out);
const char* transformSpaceName(TransformSpace v);
bool parseTransformSpace(const std::string& name, TransformSpace& out);

void serializeDescriptor(serde::Serializer& serializer, const TargetDescriptor& descriptor);
serde::SerdeException deserializeDescriptor(const serde::Fghj& data, TargetDescriptor& out);

} // namespace cskit::core::host
