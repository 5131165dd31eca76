#pragma once

#include "../host/channel_store.hpp"
#include "../host/descriptor.hpp"
#include "../serde.hpp"

#include <memory>
#include <string>
#include <vector>

namespace cskit::core::model {

class Driver;

enum class VariableKind {
    ShapeKey,
    SingleProp,
    Transforms,
    RotationDiff,
    LocationDiff,
};

const char* variableKindName(VariableKind kind);
bool parseVariableKind(const std::string& name, VariableKind& out);

// Number of target descriptors a variable of `kind` carries.
inline std::size_t targetCount(VariableKind kind) {
    return (kind == VariableKind::RotationDiff || kind == VariableKind::LocationDiff) ? 2 : 1;
}

// Descriptor a fresh variable of `kind` starts with.
host::TargetDescriptor defaultDescriptor(VariableKind kind);

// Detached copy of a variable, used by the clipboard and by document loading.
struct VariableState {
    std::string name{};
    VariableKind kind{VariableKind::ShapeKey};
    std::vector<host::TargetDescriptor> targets{};
    double restValue{0.0};
    double poseValue{1.0};
    bool showExpanded{false};

    void serialize(serde::Serializer& serializer) const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);
};

/**
 * One input of a Driver.
 *
 * Every setter that changes what the driver computes re-synthesizes the
 * owning driver's curve and expression before returning.
 */
class Variable {
public:
    explicit Variable(std::weak_ptr<Driver> owner);

    const std::string& name() const { return name_; }
    VariableKind kind() const { return kind_; }
    const std::vector<host::TargetDescriptor>& targets() const { return targets_; }
    double restValue() const { return restValue_; }
    double poseValue() const { return poseValue_; }

    // Throws std::invalid_argument when `name` is not a valid symbol. A name
    // already used by a sibling gets a numeric suffix.
    void setName(const std::string& name);
    void setKind(VariableKind kind);
    void setRestValue(double value);
    void setPoseValue(double value);
    // Throws std::out_of_range for a bad index and std::invalid_argument when
    // the descriptor alternative does not fit the variable kind.
    void setTarget(std::size_t index, const host::TargetDescriptor& descriptor);

    bool showExpanded{false};

    std::shared_ptr<Driver> driver() const { return owner_.lock(); }

    // Descriptor handed to the value source (difference kinds pair both targets).
    host::TargetDescriptor resolvable() const;
    // Live value; absent sources read as 0.
    double value() const;
    host::DriverBinding binding() const;

    VariableState state() const;
    // Replaces every field without triggering synthesis.
    void restore(const VariableState& state);

private:
    std::weak_ptr<Driver> owner_{};
    std::string name_{};
    VariableKind kind_{VariableKind::ShapeKey};
    std::vector<host::TargetDescriptor> targets_{};
    double restValue_{0.0};
    double poseValue_{1.0};

    void notifyOwner();
};

} // namespace cskit::core::model
