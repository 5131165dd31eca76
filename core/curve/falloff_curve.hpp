#pragma once

#include "keyframe.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cskit::core::curve {

enum class FalloffHandle {
    Auto,
    AutoClamped,
    Vector,
};

enum class FalloffPreset {
    Linear,
    EaseIn,
    EaseOut,
    EaseInOut,
    Smooth,
};

struct FalloffPoint {
    Point co{};
    FalloffHandle handle{FalloffHandle::Auto};

    bool operator==(const FalloffPoint&) const = default;
};

struct Range {
    double min{0.0};
    double max{1.0};
};

/**
 * Easing curve edited in normalized [0,1]x[0,1] space.
 *
 * Points stay sorted by x inside the unit square and there are always at least
 * two of them. Bezier handles are derived from the neighbouring points
 * according to each point's handle type.
 */
class FalloffCurve {
public:
    FalloffCurve();
    explicit FalloffCurve(FalloffPreset preset);

    const std::vector<FalloffPoint>& points() const { return points_; }
    std::size_t size() const { return points_.size(); }

    void reset(FalloffPreset preset);
    void setPoints(std::vector<FalloffPoint> pts);
    std::size_t insertPoint(double x, double y);
    void removePoint(std::size_t index);
    void movePoint(std::size_t index, double x, double y);
    void setHandleType(std::size_t index, FalloffHandle handle);

    // Keyframes in normalized space with their computed handles.
    std::vector<Keyframe> keyframes() const;
    double sample(double x) const;
    KeyframeCurve toBezier(const Range& xRange, const Range& yRange, bool extrapolate) const;

    void serialize(serde::Serializer& serializer) const;
    // Leaves the curve unchanged on error.
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

    bool operator==(const FalloffCurve&) const = default;

private:
    std::vector<FalloffPoint> points_{};

    void sortPoints();
};

const char* presetName(FalloffPreset preset);
bool parsePreset(const std::string& name, FalloffPreset& out);
const char* handleName(FalloffHandle handle);
bool parseHandle(const std::string& name, FalloffHandle& out);

} // namespace cskit::core::curve
