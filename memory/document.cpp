#include "document.hpp"

#include "expression.hpp"
#include "../core/debug_log.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <set>
#include <stdexcept>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace cskit::host::memory {

namespace {

math::EulerOrder orderFor(host::RotationMode mode, math::EulerOrder fallback) {
    switch (mode) {
    case host::RotationMode::XYZ: return math::EulerOrder::XYZ;
    case host::RotationMode::XZY: return math::EulerOrder::XZY;
    case host::RotationMode::YXZ: return math::EulerOrder::YXZ;
    case host::RotationMode::YZX: return math::EulerOrder::YZX;
    case host::RotationMode::ZXY: return math::EulerOrder::ZXY;
    case host::RotationMode::ZYX: return math::EulerOrder::ZYX;
    default: return fallback;
    }
}

// Axis component of an X/Y/Z transform type relative to `first`.
int axisOf(host::TransformType type, host::TransformType first) {
    return static_cast<int>(type) - static_cast<int>(first);
}

math::Quat canonical(const math::Quat& q) {
    return q.w < 0.0 ? math::Quat{-q.w, -q.x, -q.y, -q.z} : q;
}

double rotationChannel(const math::Quat& rotation, host::TransformType type, host::RotationMode mode,
                       math::EulerOrder autoOrder) {
    const math::Quat q = canonical(math::normalized(rotation));
    const int component = axisOf(type, host::TransformType::RotW);
    switch (mode) {
    case host::RotationMode::Quaternion:
        return q[component];
    case host::RotationMode::SwingTwistX:
    case host::RotationMode::SwingTwistY:
    case host::RotationMode::SwingTwistZ: {
        const int axis = static_cast<int>(mode) - static_cast<int>(host::RotationMode::SwingTwistX);
        const math::SwingTwist st = math::swingTwist(q, axis);
        if (component == 0) return 2.0 * std::acos(std::clamp(std::fabs(st.swing.w), 0.0, 1.0));
        if (component == axis + 1) return st.twist;
        return canonical(st.swing)[component];
    }
    default:
        break;
    }
    if (component == 0) return 0.0;
    const math::Vec3 euler = math::eulerFromQuat(q, orderFor(mode, autoOrder));
    return euler[component - 1];
}

double transformChannel(const math::Mat4& m, host::TransformType type, host::RotationMode mode,
                        math::EulerOrder autoOrder) {
    switch (type) {
    case host::TransformType::LocX:
    case host::TransformType::LocY:
    case host::TransformType::LocZ:
        return m.translation()[axisOf(type, host::TransformType::LocX)];
    case host::TransformType::ScaleX:
    case host::TransformType::ScaleY:
    case host::TransformType::ScaleZ:
        return m.scale()[axisOf(type, host::TransformType::ScaleX)];
    case host::TransformType::ScaleAvg: {
        const math::Vec3 s = m.scale();
        return (s.x + s.y + s.z) / 3.0;
    }
    default:
        return rotationChannel(m.rotation(), type, mode, autoOrder);
    }
}

bool parseIndexedName(const std::string& path, const std::string& prefix, int& index) {
    if (path.size() < prefix.size() + 3 || path.compare(0, prefix.size(), prefix) != 0) return false;
    if (path[prefix.size()] != '[' || path.back() != ']') return false;
    const char* first = path.data() + prefix.size() + 1;
    const char* last = path.data() + path.size() - 1;
    auto res = std::from_chars(first, last, index);
    return res.ec == std::errc{} && res.ptr == last;
}

} // namespace

bool parseCustomPath(const std::string& dataPath, std::string& name, int& index) {
    if (dataPath.size() < 4 || dataPath.compare(0, 2, "[\"") != 0) return false;
    const auto close = dataPath.find("\"]", 2);
    if (close == std::string::npos) return false;
    name = dataPath.substr(2, close - 2);
    const std::string rest = dataPath.substr(close + 2);
    if (rest.empty()) {
        index = -1;
        return true;
    }
    if (rest.size() < 3 || rest.front() != '[' || rest.back() != ']') return false;
    auto res = std::from_chars(rest.data() + 1, rest.data() + rest.size() - 1, index);
    return res.ec == std::errc{} && res.ptr == rest.data() + rest.size() - 1 && index >= 0;
}

bool parseShapeKeyPath(const std::string& dataPath, std::string& name) {
    static const std::string prefix = "key_blocks[\"";
    static const std::string suffix = "\"].value";
    if (dataPath.size() < prefix.size() + suffix.size()) return false;
    if (dataPath.compare(0, prefix.size(), prefix) != 0) return false;
    if (dataPath.compare(dataPath.size() - suffix.size(), suffix.size(), suffix) != 0) return false;
    name = dataPath.substr(prefix.size(), dataPath.size() - prefix.size() - suffix.size());
    return true;
}

MemoryDocument::MemoryDocument(std::string meshName) : meshName_(std::move(meshName)) {
    shapeKeys_.emplace_back("Basis", 0.0);
}

host::HostContext MemoryDocument::context() {
    return host::HostContext{meshName_, this, this, this, this};
}

SceneObject& MemoryDocument::addObject(const std::string& name, const std::string& parent) {
    auto& obj = objects_[name];
    obj.name = name;
    obj.parent = parent;
    return obj;
}

SceneObject* MemoryDocument::object(const std::string& name) {
    auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : &it->second;
}

const SceneObject* MemoryDocument::object(const std::string& name) const {
    auto it = objects_.find(name);
    return it == objects_.end() ? nullptr : &it->second;
}

Bone& MemoryDocument::addBone(const std::string& armature, const std::string& name, const std::string& parent) {
    if (!object(armature)) {
        throw std::invalid_argument("MemoryDocument::addBone: no armature object '" + armature + "'");
    }
    auto& b = bones_[armature][name];
    b.name = name;
    b.parent = parent;
    return b;
}

Bone* MemoryDocument::bone(const std::string& armature, const std::string& name) {
    auto it = bones_.find(armature);
    if (it == bones_.end()) return nullptr;
    auto bit = it->second.find(name);
    return bit == it->second.end() ? nullptr : &bit->second;
}

const Bone* MemoryDocument::bone(const std::string& armature, const std::string& name) const {
    auto it = bones_.find(armature);
    if (it == bones_.end()) return nullptr;
    auto bit = it->second.find(name);
    return bit == it->second.end() ? nullptr : &bit->second;
}

std::optional<math::Mat4> MemoryDocument::boneArmatureMatrix(const std::string& armature, const std::string& name) const {
    const Bone* b = bone(armature, name);
    if (!b) return std::nullopt;
    std::set<std::string> visited{name};
    math::Mat4 result = math::Mat4::multiply(math::Mat4::compose(b->restLocation, b->restRotation, math::Vec3{1.0, 1.0, 1.0}),
                                             b->pose.matrix());
    while (!b->parent.empty()) {
        if (!visited.insert(b->parent).second) {
            CSKIT_DBG_LOG("[cskit] bone parent cycle at '%s' in '%s'\n", b->parent.c_str(), armature.c_str());
            return std::nullopt;
        }
        b = bone(armature, b->parent);
        if (!b) return std::nullopt;
        math::Mat4 local = math::Mat4::multiply(
            math::Mat4::compose(b->restLocation, b->restRotation, math::Vec3{1.0, 1.0, 1.0}), b->pose.matrix());
        result = math::Mat4::multiply(local, result);
    }
    return result;
}

std::optional<math::Mat4> MemoryDocument::worldMatrix(const std::string& objectName, const std::string& boneName) const {
    const SceneObject* obj = object(objectName);
    if (!obj) return std::nullopt;
    math::Mat4 world = obj->transform.matrix();
    std::set<std::string> visited{objectName};
    for (const SceneObject* p = object(obj->parent); p; p = object(p->parent)) {
        if (!visited.insert(p->name).second) {
            CSKIT_DBG_LOG("[cskit] object parent cycle at '%s'\n", p->name.c_str());
            return std::nullopt;
        }
        world = math::Mat4::multiply(p->transform.matrix(), world);
    }
    if (boneName.empty()) return world;
    auto local = boneArmatureMatrix(objectName, boneName);
    if (!local) return std::nullopt;
    return math::Mat4::multiply(world, *local);
}

std::optional<math::Mat4> MemoryDocument::spaceMatrix(const std::string& objectName, const std::string& boneName,
                                                      host::TransformSpace space) const {
    if (space == host::TransformSpace::World) return worldMatrix(objectName, boneName);
    const SceneObject* obj = object(objectName);
    if (!obj) return std::nullopt;
    if (boneName.empty()) return obj->transform.matrix();
    const Bone* b = bone(objectName, boneName);
    if (!b) return std::nullopt;
    return b->pose.matrix();
}

void MemoryDocument::setMeshProperty(const std::string& dataPath, double value) {
    meshProperties_[dataPath] = value;
}

bool MemoryDocument::setShapeKeyValue(const std::string& name, double value) {
    for (auto& [key, v] : shapeKeys_) {
        if (key == name) {
            v = value;
            return true;
        }
    }
    return false;
}

bool MemoryDocument::isMesh(const std::string& name) const {
    if (name == meshName_) return true;
    const SceneObject* obj = object(name);
    return obj && obj->dataType == host::IdType::Mesh && obj->dataName == meshName_;
}

std::optional<double> MemoryDocument::resolve(const host::TargetDescriptor& descriptor) const {
    return std::visit([&](const auto& ref) -> std::optional<double> {
        using T = std::decay_t<decltype(ref)>;
        if constexpr (std::is_same_v<T, host::ShapeKeyRef>) {
            if (!isMesh(ref.object)) return std::nullopt;
            return shapeKeyValue(ref.shape);
        } else if constexpr (std::is_same_v<T, host::PropertyRef>) {
            return resolveProperty(ref);
        } else if constexpr (std::is_same_v<T, host::TransformRef>) {
            return resolveTransform(ref);
        } else if constexpr (std::is_same_v<T, host::ObjectRef>) {
            auto m = spaceMatrix(ref.object, ref.bone, ref.space);
            if (!m) return std::nullopt;
            return math::length(m->translation());
        } else {
            return resolveDifference(ref);
        }
    }, descriptor);
}

std::optional<double> MemoryDocument::resolveProperty(const host::PropertyRef& ref) const {
    switch (ref.idType) {
    case host::IdType::Key:
        if (!isMesh(ref.object)) return std::nullopt;
        return resolveKeyPath(ref.dataPath);
    case host::IdType::Mesh:
        if (!isMesh(ref.object)) return std::nullopt;
        return resolveMeshPath(ref.dataPath);
    case host::IdType::Object: {
        const SceneObject* obj = object(ref.object);
        if (!obj) return std::nullopt;
        auto it = obj->properties.find(ref.dataPath);
        if (it != obj->properties.end()) return it->second;
        int index = 0;
        const auto& t = obj->transform;
        if (parseIndexedName(ref.dataPath, "location", index) && index >= 0 && index < 3) return t.location[index];
        if (parseIndexedName(ref.dataPath, "scale", index) && index >= 0 && index < 3) return t.scale[index];
        if (parseIndexedName(ref.dataPath, "rotation_quaternion", index) && index >= 0 && index < 4) return t.rotation[index];
        if (parseIndexedName(ref.dataPath, "rotation_euler", index) && index >= 0 && index < 3) {
            return math::eulerFromQuat(t.rotation, t.eulerOrder)[index];
        }
        return std::nullopt;
    }
    default:
        break;
    }
    for (const auto& [name, obj] : objects_) {
        if (obj.dataType != ref.idType || obj.dataName != ref.object) continue;
        auto it = obj.dataProperties.find(ref.dataPath);
        if (it != obj.dataProperties.end()) return it->second;
    }
    return std::nullopt;
}

std::optional<double> MemoryDocument::resolveTransform(const host::TransformRef& ref) const {
    auto m = spaceMatrix(ref.object, ref.bone, ref.space);
    if (!m) return std::nullopt;
    math::EulerOrder autoOrder = math::EulerOrder::XYZ;
    if (ref.bone.empty()) {
        autoOrder = object(ref.object)->transform.eulerOrder;
    } else {
        autoOrder = bone(ref.object, ref.bone)->pose.eulerOrder;
    }
    return transformChannel(*m, ref.type, ref.rotationMode, autoOrder);
}

std::optional<double> MemoryDocument::resolveDifference(const host::DifferenceRef& ref) const {
    if (ref.kind == host::DifferenceKind::Rotation) {
        auto a = worldMatrix(ref.a.object, ref.a.bone);
        auto b = worldMatrix(ref.b.object, ref.b.bone);
        if (!a || !b) return std::nullopt;
        return math::rotationalDifference(a->rotation(), b->rotation());
    }
    auto a = spaceMatrix(ref.a.object, ref.a.bone, ref.a.space);
    auto b = spaceMatrix(ref.b.object, ref.b.bone, ref.b.space);
    if (!a || !b) return std::nullopt;
    return math::length(a->translation() - b->translation());
}

std::optional<double> MemoryDocument::resolveMeshPath(const std::string& dataPath) const {
    std::string name;
    int index = -1;
    if (parseCustomPath(dataPath, name, index) && index >= 0) {
        auto it = arrays_.find(name);
        if (it == arrays_.end() || static_cast<std::size_t>(index) >= it->second.size()) return std::nullopt;
        return it->second[static_cast<std::size_t>(index)];
    }
    auto it = meshProperties_.find(dataPath);
    if (it == meshProperties_.end()) return std::nullopt;
    return it->second;
}

std::optional<double> MemoryDocument::resolveKeyPath(const std::string& dataPath) const {
    std::string name;
    if (!parseShapeKeyPath(dataPath, name)) return std::nullopt;
    return shapeKeyValue(name);
}

host::DriverChannel* MemoryDocument::find(const host::ChannelAddress& address) {
    auto it = channels_.find(address);
    return it == channels_.end() ? nullptr : &it->second;
}

host::DriverChannel& MemoryDocument::ensure(const host::ChannelAddress& address) {
    return channels_[address];
}

bool MemoryDocument::remove(const host::ChannelAddress& address) {
    return channels_.erase(address) > 0;
}

void MemoryDocument::assign(const std::string& name, const std::vector<double>& values) {
    arrays_[name] = values;
}

std::optional<std::vector<double>> MemoryDocument::get(const std::string& name) const {
    auto it = arrays_.find(name);
    if (it == arrays_.end()) return std::nullopt;
    return it->second;
}

bool MemoryDocument::remove(const std::string& name) {
    return arrays_.erase(name) > 0;
}

bool MemoryDocument::hasShapeKey(const std::string& name) const {
    return shapeKeyValue(name).has_value();
}

std::vector<std::string> MemoryDocument::shapeKeyNames() const {
    std::vector<std::string> out;
    out.reserve(shapeKeys_.size());
    for (const auto& entry : shapeKeys_) out.push_back(entry.first);
    return out;
}

std::optional<double> MemoryDocument::shapeKeyValue(const std::string& name) const {
    for (const auto& [key, value] : shapeKeys_) {
        if (key == name) return value;
    }
    return std::nullopt;
}

bool MemoryDocument::addShapeKey(const std::string& name) {
    if (name.empty() || hasShapeKey(name)) return false;
    shapeKeys_.emplace_back(name, 0.0);
    return true;
}

bool MemoryDocument::setActiveShapeKey(const std::string& name) {
    if (!hasShapeKey(name)) return false;
    activeShapeKey_ = name;
    return true;
}

double MemoryDocument::evaluateDriver(const host::ScriptedDriver& driver) const {
    ExpressionEvaluator::Symbols symbols;
    std::vector<double> values;
    for (const auto& binding : driver.bindings) {
        double value = 0.0;
        if (binding.kind == host::BindingKind::RotationDiff || binding.kind == host::BindingKind::LocationDiff) {
            const auto* a = binding.targets.size() > 0 ? std::get_if<host::ObjectRef>(&binding.targets[0]) : nullptr;
            const auto* b = binding.targets.size() > 1 ? std::get_if<host::ObjectRef>(&binding.targets[1]) : nullptr;
            if (a && b) {
                const auto kind = binding.kind == host::BindingKind::RotationDiff ? host::DifferenceKind::Rotation
                                                                                 : host::DifferenceKind::Location;
                value = resolveDifference(host::DifferenceRef{kind, *a, *b}).value_or(0.0);
            }
        } else if (!binding.targets.empty()) {
            value = resolve(binding.targets.front()).value_or(0.0);
        }
        symbols[binding.name] = value;
        values.push_back(value);
    }

    switch (driver.type) {
    case host::DriverType::Scripted:
        return evaluateExpression(driver.expression, symbols);
    case host::DriverType::Average:
    case host::DriverType::Sum: {
        double sum = 0.0;
        for (double v : values) sum += v;
        if (driver.type == host::DriverType::Sum) return sum;
        return values.empty() ? 0.0 : sum / static_cast<double>(values.size());
    }
    case host::DriverType::Min:
        return values.empty() ? 0.0 : *std::min_element(values.begin(), values.end());
    case host::DriverType::Max:
        return values.empty() ? 0.0 : *std::max_element(values.begin(), values.end());
    }
    return 0.0;
}

bool MemoryDocument::writeMeshPath(const std::string& dataPath, int arrayIndex, double value) {
    std::string name;
    int index = -1;
    if (!parseCustomPath(dataPath, name, index)) return false;
    if (arrayIndex >= 0) index = arrayIndex;
    if (index < 0) {
        meshProperties_[dataPath] = value;
        return true;
    }
    auto it = arrays_.find(name);
    if (it == arrays_.end() || static_cast<std::size_t>(index) >= it->second.size()) return false;
    it->second[static_cast<std::size_t>(index)] = value;
    return true;
}

void MemoryDocument::evaluate() {
    for (auto owner : {host::ChannelOwner::Mesh, host::ChannelOwner::ShapeKeys}) {
        for (const auto& [address, channel] : channels_) {
            if (address.owner != owner || channel.mute) continue;
            const double input = evaluateDriver(channel.driver);
            const double output = channel.curve.empty() ? input : channel.curve.evaluate(input);
            if (owner == host::ChannelOwner::Mesh) {
                if (!writeMeshPath(address.dataPath, address.arrayIndex, output)) {
                    CSKIT_DBG_LOG("[cskit] memory: no slot for %s[%d]\n", address.dataPath.c_str(), address.arrayIndex);
                }
                continue;
            }
            std::string shape;
            if (!parseShapeKeyPath(address.dataPath, shape) || !setShapeKeyValue(shape, output)) {
                CSKIT_DBG_LOG("[cskit] memory: no shape key for %s\n", address.dataPath.c_str());
            }
        }
    }
}

} // namespace cskit::host::memory
