#pragma once

#include <cstddef>
#include <utility>
#include <vector>

namespace cskit::core::curve {

struct Point {
    double x{0.0};
    double y{0.0};

    bool operator==(const Point&) const = default;
};

enum class Interpolation {
    Constant,
    Linear,
    Bezier,
};

enum class HandleType {
    Free,
    Aligned,
    Vector,
    Auto,
    AutoClamped,
};

enum class Extrapolation {
    Constant,
    Linear,
};

struct Keyframe {
    Point co{};
    Point handleLeft{};
    Point handleRight{};
    Interpolation interpolation{Interpolation::Bezier};
    HandleType handleLeftType{HandleType::Free};
    HandleType handleRightType{HandleType::Free};

    bool operator==(const Keyframe&) const = default;
};

class KeyframeCurve {
public:
    std::vector<Keyframe> keyframes{};
    Extrapolation extrapolation{Extrapolation::Constant};

    KeyframeCurve() = default;
    KeyframeCurve(std::vector<Keyframe> keys, Extrapolation extra)
        : keyframes(std::move(keys)), extrapolation(extra) {}

    std::size_t size() const { return keyframes.size(); }
    bool empty() const { return keyframes.empty(); }

    // Keys are assumed sorted by x.
    double evaluate(double x) const;

    bool operator==(const KeyframeCurve&) const = default;

private:
    double extrapolateBefore(double x) const;
    double extrapolateAfter(double x) const;
    static double evaluateSegment(const Keyframe& a, const Keyframe& b, double x);
};

// Parameter t in [0,1] of the cubic bezier (p0,p1,p2,p3) whose x equals `x`.
double solveBezierX(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double x);

} // namespace cskit::core::curve
