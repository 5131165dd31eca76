#pragma once

#include "channel_store.hpp"
#include "value_source.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cskit::core::host {

// Named custom float arrays stored on the mesh.
class PropertyArrayStore {
public:
    virtual ~PropertyArrayStore() = default;

    virtual void assign(const std::string& name, const std::vector<double>& values) = 0;
    virtual std::optional<std::vector<double>> get(const std::string& name) const = 0;
    virtual bool remove(const std::string& name) = 0;
};

class ShapeKeySet {
public:
    virtual ~ShapeKeySet() = default;

    virtual bool hasShapeKey(const std::string& name) const = 0;
    virtual std::vector<std::string> shapeKeyNames() const = 0;
    virtual std::optional<double> shapeKeyValue(const std::string& name) const = 0;
    virtual bool addShapeKey(const std::string& name) = 0;
    // Makes `name` the mesh's active shape key; false when there is no such key.
    virtual bool setActiveShapeKey(const std::string& name) = 0;
};

// The host services bound to one mesh.
struct HostContext {
    std::string meshName{};
    ValueSource* values{nullptr};
    ChannelStore* channels{nullptr};
    PropertyArrayStore* arrays{nullptr};
    ShapeKeySet* shapeKeys{nullptr};

    bool complete() const { return values && channels && arrays && shapeKeys; }
};

} // namespace cskit::core::host
