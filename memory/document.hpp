#pragma once

#include "../core/host/host_context.hpp"
#include "../core/math/rotation.hpp"
#include "../core/math/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cskit::host::memory {

namespace host = ::cskit::core::host;
namespace math = ::cskit::core::math;

// Local transform channels, composed as translation * rotation * scale.
struct TransformChannels {
    math::Vec3 location{};
    math::Quat rotation{};
    math::Vec3 scale{1.0, 1.0, 1.0};
    // Euler order reported for RotationMode::Auto.
    math::EulerOrder eulerOrder{math::EulerOrder::XYZ};

    math::Mat4 matrix() const { return math::Mat4::compose(location, rotation, scale); }
};

struct SceneObject {
    std::string name{};
    std::string parent{};
    TransformChannels transform{};
    // Custom properties addressed by their full data path, e.g. `["weight"]`.
    std::map<std::string, double> properties{};
    // Object data (mesh, armature, light, ...) and its properties.
    host::IdType dataType{host::IdType::Object};
    std::string dataName{};
    std::map<std::string, double> dataProperties{};
};

struct Bone {
    std::string name{};
    std::string parent{};
    // Rest placement relative to the parent bone (or the armature).
    math::Vec3 restLocation{};
    math::Quat restRotation{};
    TransformChannels pose{};
};

/**
 * Reference host: one mesh with its shape keys, custom arrays and driver
 * channels, inside a small scene of objects and armature bones.
 *
 * Transform spaces: World composes parents; Transform and Local both report
 * the object's or bone's own channels.
 */
class MemoryDocument final : public host::ValueSource,
                             public host::ChannelStore,
                             public host::PropertyArrayStore,
                             public host::ShapeKeySet {
public:
    explicit MemoryDocument(std::string meshName);

    const std::string& meshName() const { return meshName_; }
    host::HostContext context();

    // Scene
    SceneObject& addObject(const std::string& name, const std::string& parent = {});
    SceneObject* object(const std::string& name);
    const SceneObject* object(const std::string& name) const;
    Bone& addBone(const std::string& armature, const std::string& name, const std::string& parent = {});
    Bone* bone(const std::string& armature, const std::string& name);
    const Bone* bone(const std::string& armature, const std::string& name) const;
    std::optional<math::Mat4> worldMatrix(const std::string& object, const std::string& bone) const;
    std::optional<math::Mat4> spaceMatrix(const std::string& object, const std::string& bone, host::TransformSpace space) const;

    // Mesh custom properties other than the arrays, addressed like `["name"]`.
    void setMeshProperty(const std::string& dataPath, double value);
    bool setShapeKeyValue(const std::string& name, double value);

    // ValueSource
    std::optional<double> resolve(const host::TargetDescriptor& descriptor) const override;

    // ChannelStore
    host::DriverChannel* find(const host::ChannelAddress& address) override;
    host::DriverChannel& ensure(const host::ChannelAddress& address) override;
    bool remove(const host::ChannelAddress& address) override;
    const std::map<host::ChannelAddress, host::DriverChannel>& channels() const { return channels_; }

    // PropertyArrayStore
    void assign(const std::string& name, const std::vector<double>& values) override;
    std::optional<std::vector<double>> get(const std::string& name) const override;
    bool remove(const std::string& name) override;

    // ShapeKeySet
    bool hasShapeKey(const std::string& name) const override;
    std::vector<std::string> shapeKeyNames() const override;
    std::optional<double> shapeKeyValue(const std::string& name) const override;
    bool addShapeKey(const std::string& name) override;
    bool setActiveShapeKey(const std::string& name) override;
    const std::string& activeShapeKey() const { return activeShapeKey_; }

    // Value of one driver channel for the current scene, before its curve.
    double evaluateDriver(const host::ScriptedDriver& driver) const;
    // Runs every mesh channel (into the custom arrays), then every shape key
    // channel (into the shape key values). Muted channels are skipped.
    void evaluate();

private:
    std::string meshName_{};
    std::map<std::string, SceneObject> objects_{};
    std::map<std::string, std::map<std::string, Bone>> bones_{};
    std::vector<std::pair<std::string, double>> shapeKeys_{};
    std::string activeShapeKey_{};
    std::map<std::string, std::vector<double>> arrays_{};
    std::map<std::string, double> meshProperties_{};
    std::map<host::ChannelAddress, host::DriverChannel> channels_{};

    bool isMesh(const std::string& object) const;
    std::optional<math::Mat4> boneArmatureMatrix(const std::string& armature, const std::string& bone) const;
    std::optional<double> resolveProperty(const host::PropertyRef& ref) const;
    std::optional<double> resolveTransform(const host::TransformRef& ref) const;
    std::optional<double> resolveDifference(const host::DifferenceRef& ref) const;
    std::optional<double> resolveMeshPath(const std::string& dataPath) const;
    std::optional<double> resolveKeyPath(const std::string& dataPath) const;
    bool writeMeshPath(const std::string& dataPath, int arrayIndex, double value);
};

// Splits `["name"]` or `["name"][3]` into name and index (-1 when absent).
bool parseCustomPath(const std::string& dataPath, std::string& name, int& index);
// Extracts the shape key name from `key_blocks["name"].value`.
bool parseShapeKeyPath(const std::string& dataPath, std::string& name);

} // namespace cskit::host::memory
