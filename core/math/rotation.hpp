#pragma once

#include "types.hpp"

namespace cskit::core::math {

// Order names the axis applied first: XYZ rotates about X, then Y, then Z.
enum class EulerOrder {
    XYZ,
    XZY,
    YXZ,
    YZX,
    ZXY,
    ZYX,
};

struct SwingTwist {
    Quat swing{};
    double twist{0.0};
};

Quat normalized(const Quat& q);
Quat multiply(const Quat& lhs, const Quat& rhs);
double dot(const Quat& a, const Quat& b);

Quat quatFromAxisAngle(int axis, double angle);
Quat quatFromEuler(const Vec3& angles, EulerOrder order);
Vec3 eulerFromQuat(const Quat& q, EulerOrder order);
void quatToMat3(const Quat& q, double (&m)[3][3]);

// Splits q into swing * twist, the twist being a rotation about `axis`.
SwingTwist swingTwist(const Quat& q, int axis);

// Angle in radians of the rotation taking a onto b.
double rotationalDifference(const Quat& a, const Quat& b);

} // namespace cskit::core::math
