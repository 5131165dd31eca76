#pragma once

#include "../curve/keyframe.hpp"
#include "descriptor.hpp"

#include <string>
#include <tuple>
#include <vector>

namespace cskit::core::host {

enum class ChannelOwner {
    Mesh,
    ShapeKeys,
};

struct ChannelAddress {
    ChannelOwner owner{ChannelOwner::Mesh};
    std::string dataPath{};
    int arrayIndex{-1};

    bool operator==(const ChannelAddress&) const = default;
    bool operator<(const ChannelAddress& other) const {
        return std::tie(owner, dataPath, arrayIndex) < std::tie(other.owner, other.dataPath, other.arrayIndex);
    }
};

enum class DriverType {
    Scripted,
    Average,
    Sum,
    Min,
    Max,
};

enum class BindingKind {
    SingleProp,
    Transforms,
    RotationDiff,
    LocationDiff,
};

struct DriverBinding {
    std::string name{};
    BindingKind kind{BindingKind::SingleProp};
    std::vector<TargetDescriptor> targets{};

    bool operator==(const DriverBinding&) const = default;
};

struct ScriptedDriver {
    DriverType type{DriverType::Scripted};
    std::string expression{};
    std::vector<DriverBinding> bindings{};

    bool operator==(const ScriptedDriver&) const = default;
};

// Animation curve plus the driver that feeds it, one per addressed channel.
struct DriverChannel {
    curve::KeyframeCurve curve{};
    ScriptedDriver driver{};
    bool mute{false};

    bool operator==(const DriverChannel&) const = default;
};

class ChannelStore {
public:
    virtual ~ChannelStore() = default;

    virtual DriverChannel* find(const ChannelAddress& address) = 0;
    virtual DriverChannel& ensure(const ChannelAddress& address) = 0;
    // Returns false when nothing was bound at `address`.
    virtual bool remove(const ChannelAddress& address) = 0;
};

const char* driverTypeName(DriverType v);
const char* bindingKindName(BindingKind v);

} // namespace cskit::core::host
