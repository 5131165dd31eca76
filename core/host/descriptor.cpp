#include "descriptor.hpp"
#include "channel_store.hpp"

#include <array>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace cskit::core::host {

namespace {

template <typename E, std::size_t N>
const char* nameOf(const std::array<std::pair<E, const char*>, N>& table, E v) {
    for (const auto& [value, name] : table) {
        if (value == v) return name;
    }
    return "";
}

template <typename E, std::size_t N>
bool parseOf(const std::array<std::pair<E, const char*>, N>& table, const std::string& name, E& out) {
    for (const auto& [value, label] : table) {
        if (name == label) {
            out = value;
            return true;
        }
    }
    return false;
}

constexpr std::array<std::pair<IdType, const char*>, 14> kIdTypes{{
    {IdType::Object, "OBJECT"},
    {IdType::Mesh, "MESH"},
    {IdType::Curve, "CURVE"},
    {IdType::Meta, "META"},
    {IdType::Font, "FONT"},
    {IdType::Volume, "VOLUME"},
    {IdType::GreasePencil, "GREASEPENCIL"},
    {IdType::Armature, "ARMATURE"},
    {IdType::Lattice, "LATTICE"},
    {IdType::Light, "LIGHT"},
    {IdType::LightProbe, "LIGHT_PROBE"},
    {IdType::Camera, "CAMERA"},
    {IdType::Speaker, "SPEAKER"},
    {IdType::Key, "KEY"},
}};

constexpr std::array<std::pair<TransformType, const char*>, 11> kTransformTypes{{
    {TransformType::LocX, "LOC_X"},
    {TransformType::LocY, "LOC_Y"},
    {TransformType::LocZ, "LOC_Z"},
    {TransformType::RotW, "ROT_W"},
    {TransformType::RotX, "ROT_X"},
    {TransformType::RotY, "ROT_Y"},
    {TransformType::RotZ, "ROT_Z"},
    {TransformType::ScaleX, "SCALE_X"},
    {TransformType::ScaleY, "SCALE_Y"},
    {TransformType::ScaleZ, "SCALE_Z"},
    {TransformType::ScaleAvg, "SCALE_AVG"},
}};

constexpr std::array<std::pair<RotationMode, const char*>, 11> kRotationModes{{
    {RotationMode::Auto, "AUTO"},
    {RotationMode::XYZ, "XYZ"},
    {RotationMode::XZY, "XZY"},
    {RotationMode::YXZ, "YXZ"},
    {RotationMode::YZX, "YZX"},
    {RotationMode::ZXY, "ZXY"},
    {RotationMode::ZYX, "ZYX"},
    {RotationMode::Quaternion, "QUATERNION"},
    {RotationMode::SwingTwistX, "SWING_TWIST_X"},
    {RotationMode::SwingTwistY, "SWING_TWIST_Y"},
    {RotationMode::SwingTwistZ, "SWING_TWIST_Z"},
}};

constexpr std::array<std::pair<TransformSpace, const char*>, 3> kSpaces{{
    {TransformSpace::World, "WORLD_SPACE"},
    {TransformSpace::Transform, "TRANSFORM_SPACE"},
    {TransformSpace::Local, "LOCAL_SPACE"},
}};

void serializeObjectRef(serde::Serializer& s, const ObjectRef& ref) {
    s.putKey("object");
    s.putValue(ref.object);
    s.putKey("bone");
    s.putValue(ref.bone);
    s.putKey("space");
    s.putValue(std::string(transformSpaceName(ref.space)));
}

void deserializeObjectRef(const serde::Fghj& data, ObjectRef& ref) {
    if (auto v = data.get_optional<std::string>("object")) ref.object = *v;
    if (auto v = data.get_optional<std::string>("bone")) ref.bone = *v;
    if (auto v = data.get_optional<std::string>("space")) {
        if (!parseTransformSpace(*v, ref.space)) throw std::runtime_error("unknown transform space: " + *v);
    }
}

} // namespace

std::string shapeKeyValuePath(const std::string& shape) {
    return "key_blocks[\"" + shape + "\"].value";
}

const char* idTypeName(IdType v) { return nameOf(kIdTypes, v); }
bool parseIdType(const std::string& name, IdType& out) { return parseOf(kIdTypes, name, out); }
const char* transformTypeName(TransformType v) { return nameOf(kTransformTypes, v); }
bool parseTransformType(const std::string& name, TransformType& out) { return parseOf(kTransformTypes, name, out); }
const char* rotationModeName(RotationMode v) { return nameOf(kRotationModes, v); }
bool parseRotationMode(const std::string& name, RotationMode& out) { return parseOf(kRotationModes, name, out); }
const char* transformSpaceName(TransformSpace v) { return nameOf(kSpaces, v); }
bool parseTransformSpace(const std::string& name, TransformSpace& out) { return parseOf(kSpaces, name, out); }

const char* driverTypeName(DriverType v) {
    switch (v) {
    case DriverType::Scripted: return "SCRIPTED";
    case DriverType::Average: return "AVERAGE";
    case DriverType::Sum: return "SUM";
    case DriverType::Min: return "MIN";
    case DriverType::Max: return "MAX";
    }
    return "";
}

const char* bindingKindName(BindingKind v) {
    switch (v) {
    case BindingKind::SingleProp: return "SINGLE_PROP";
    case BindingKind::Transforms: return "TRANSFORMS";
    case BindingKind::RotationDiff: return "ROTATION_DIFF";
    case BindingKind::LocationDiff: return "LOC_DIFF";
    }
    return "";
}

void serializeDescriptor(serde::Serializer& s, const TargetDescriptor& descriptor) {
    std::visit([&](const auto& ref) {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, ShapeKeyRef>) {
            s.putKey("type");
            s.putValue(std::string("SHAPE_KEY"));
            s.putKey("object");
            s.putValue(ref.object);
            s.putKey("shape");
            s.putValue(ref.shape);
        } else if constexpr (std::is_same_v<T, PropertyRef>) {
            s.putKey("type");
            s.putValue(std::string("SINGLE_PROP"));
            s.putKey("id_type");
            s.putValue(std::string(idTypeName(ref.idType)));
            s.putKey("object");
            s.putValue(ref.object);
            s.putKey("data_path");
            s.putValue(ref.dataPath);
        } else if constexpr (std::is_same_v<T, TransformRef>) {
            s.putKey("type");
            s.putValue(std::string("TRANSFORMS"));
            s.putKey("object");
            s.putValue(ref.object);
            s.putKey("bone");
            s.putValue(ref.bone);
            s.putKey("transform_type");
            s.putValue(std::string(transformTypeName(ref.type)));
            s.putKey("rotation_mode");
            s.putValue(std::string(rotationModeName(ref.rotationMode)));
            s.putKey("space");
            s.putValue(std::string(transformSpaceName(ref.space)));
        } else if constexpr (std::is_same_v<T, ObjectRef>) {
            s.putKey("type");
            s.putValue(std::string("OBJECT"));
            serializeObjectRef(s, ref);
        } else {
            s.putKey("type");
            s.putValue(std::string(ref.kind == DifferenceKind::Rotation ? "ROTATION_DIFF" : "LOC_DIFF"));
            serde::Serializer a;
            serializeObjectRef(a, ref.a);
            serde::Serializer b;
            serializeObjectRef(b, ref.b);
            s.putChild("a", a);
            s.putChild("b", b);
        }
    }, descriptor);
}

serde::SerdeException deserializeDescriptor(const serde::Fghj& data, TargetDescriptor& out) {
    try {
        auto type = data.get<std::string>("type");
        if (type == "SHAPE_KEY") {
            ShapeKeyRef ref;
            ref.object = data.get<std::string>("object", "");
            ref.shape = data.get<std::string>("shape", "");
            out = ref;
        } else if (type == "SINGLE_PROP") {
            PropertyRef ref;
            if (auto v = data.get_optional<std::string>("id_type")) {
                if (!parseIdType(*v, ref.idType)) return std::string("unknown id type: ") + *v;
            }
            ref.object = data.get<std::string>("object", "");
            ref.dataPath = data.get<std::string>("data_path", "");
            out = ref;
        } else if (type == "TRANSFORMS") {
            TransformRef ref;
            ref.object = data.get<std::string>("object", "");
            ref.bone = data.get<std::string>("bone", "");
            if (auto v = data.get_optional<std::string>("transform_type")) {
                if (!parseTransformType(*v, ref.type)) return std::string("unknown transform type: ") + *v;
            }
            if (auto v = data.get_optional<std::string>("rotation_mode")) {
                if (!parseRotationMode(*v, ref.rotationMode)) return std::string("unknown rotation mode: ") + *v;
            }
            if (auto v = data.get_optional<std::string>("space")) {
                if (!parseTransformSpace(*v, ref.space)) return std::string("unknown transform space: ") + *v;
            }
            out = ref;
        } else if (type == "OBJECT") {
            ObjectRef ref;
            deserializeObjectRef(data, ref);
            out = ref;
        } else if (type == "ROTATION_DIFF" || type == "LOC_DIFF") {
            DifferenceRef ref;
            ref.kind = type == "ROTATION_DIFF" ? DifferenceKind::Rotation : DifferenceKind::Location;
            if (auto a = data.get_child_optional("a")) deserializeObjectRef(*a, ref.a);
            if (auto b = data.get_child_optional("b")) deserializeObjectRef(*b, ref.b);
            out = ref;
        } else {
            return std::string("unknown target type: ") + type;
        }
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace cskit::core::host
