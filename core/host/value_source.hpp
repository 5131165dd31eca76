#pragma once

#include "descriptor.hpp"

#include <optional>

namespace cskit::core::host {

class ValueSource {
public:
    virtual ~ValueSource() = default;

    // Absence (missing object, bone, shape key or path) is reported as nullopt, never thrown.
    virtual std::optional<double> resolve(const TargetDescriptor& descriptor) const = 0;
};

} // namespace cskit::core::host
