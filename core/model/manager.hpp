#pragma once

#include "target.hpp"
#include "../config.hpp"
#include "../host/host_context.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace cskit::core::model {

// Fresh 32 hex digit identifier for a target.
std::string generateIdentifier();

// The combination shape keys of one mesh.
class Manager : public std::enable_shared_from_this<Manager> {
public:
    Manager(host::HostContext host, EngineConfig config);

    const host::HostContext& host() const { return host_; }
    const EngineConfig& config() const { return config_; }

    const std::vector<std::shared_ptr<Target>>& targets() const { return targets_; }
    std::size_t size() const { return targets_.size(); }
    std::size_t activeIndex() const { return activeIndex_; }
    // Selects a target and makes its shape key the mesh's active one when it
    // exists. An index past the end selects nothing.
    void setActiveIndex(std::size_t index);
    std::shared_ptr<Target> active() const;
    std::shared_ptr<Target> findTarget(const std::string& name) const;
    std::shared_ptr<Target> findByIdentifier(const std::string& identifier) const;

    // Appends a target and gives it its (empty) private array. An empty
    // identifier gets a generated one.
    std::shared_ptr<Target> addTarget(const std::string& name, std::string identifier = {});
    // Throws std::out_of_range; releases every channel the target owns.
    void removeTarget(std::size_t index);
    void moveTarget(std::size_t from, std::size_t to);

    // Re-synthesizes every driver and target.
    void updateAll();

    void serialize(serde::Serializer& serializer) const;
    // Replaces the targets; nothing is synthesized.
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

private:
    host::HostContext host_{};
    EngineConfig config_{};
    std::vector<std::shared_ptr<Target>> targets_{};
    std::size_t activeIndex_{0};
};

// Lazily created managers keyed by mesh name.
class ManagerRegistry {
public:
    explicit ManagerRegistry(EngineConfig config = {}) : config_(std::move(config)) {}

    std::shared_ptr<Manager> ensure(const std::string& meshName, const host::HostContext& host);
    std::shared_ptr<Manager> find(const std::string& meshName) const;
    bool remove(const std::string& meshName);
    std::size_t size() const { return managers_.size(); }

private:
    EngineConfig config_{};
    std::map<std::string, std::shared_ptr<Manager>> managers_{};
};

} // namespace cskit::core::model
