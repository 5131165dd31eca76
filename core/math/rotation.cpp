#include "rotation.hpp"

#include <boost/qvm/quat_operations.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <numbers>

namespace cskit::core::math {

namespace {
struct OrderAxes {
    int i;
    int j;
    int k;
    double parity;
};

OrderAxes axesFor(EulerOrder order) {
    switch (order) {
    case EulerOrder::XYZ: return {0, 1, 2, 1.0};
    case EulerOrder::YZX: return {1, 2, 0, 1.0};
    case EulerOrder::ZXY: return {2, 0, 1, 1.0};
    case EulerOrder::XZY: return {0, 2, 1, -1.0};
    case EulerOrder::YXZ: return {1, 0, 2, -1.0};
    case EulerOrder::ZYX: return {2, 1, 0, -1.0};
    }
    return {0, 1, 2, 1.0};
}
} // namespace

Quat normalized(const Quat& q) {
    const double len = std::sqrt(dot(q, q));
    if (len == 0.0) return Quat{};
    return Quat::fromQvm(boost::qvm::normalized(q.toQvm()));
}

Quat multiply(const Quat& lhs, const Quat& rhs) {
    return Quat::fromQvm(boost::qvm::operator*(lhs.toQvm(), rhs.toQvm()));
}

double dot(const Quat& a, const Quat& b) {
    return boost::qvm::dot(a.toQvm(), b.toQvm());
}

Quat quatFromAxisAngle(int axis, double angle) {
    switch (axis) {
    case 0: return Quat::fromQvm(boost::qvm::convert_to<boost::qvm::quat<double>>(boost::qvm::rotx_quat(angle)));
    case 1: return Quat::fromQvm(boost::qvm::convert_to<boost::qvm::quat<double>>(boost::qvm::roty_quat(angle)));
    default: return Quat::fromQvm(boost::qvm::convert_to<boost::qvm::quat<double>>(boost::qvm::rotz_quat(angle)));
    }
}

Quat quatFromEuler(const Vec3& angles, EulerOrder order) {
    const auto ax = axesFor(order);
    const Quat qi = quatFromAxisAngle(ax.i, angles[ax.i]);
    const Quat qj = quatFromAxisAngle(ax.j, angles[ax.j]);
    const Quat qk = quatFromAxisAngle(ax.k, angles[ax.k]);
    return normalized(multiply(qk, multiply(qj, qi)));
}

void quatToMat3(const Quat& in, double (&m)[3][3]) {
    const Quat q = normalized(in);
    const double xx = q.x * q.x, yy = q.y * q.y, zz = q.z * q.z;
    const double xy = q.x * q.y, xz = q.x * q.z, yz = q.y * q.z;
    const double wx = q.w * q.x, wy = q.w * q.y, wz = q.w * q.z;
    m[0][0] = 1.0 - 2.0 * (yy + zz);
    m[0][1] = 2.0 * (xy - wz);
    m[0][2] = 2.0 * (xz + wy);
    m[1][0] = 2.0 * (xy + wz);
    m[1][1] = 1.0 - 2.0 * (xx + zz);
    m[1][2] = 2.0 * (yz - wx);
    m[2][0] = 2.0 * (xz - wy);
    m[2][1] = 2.0 * (yz + wx);
    m[2][2] = 1.0 - 2.0 * (xx + yy);
}

Vec3 eulerFromQuat(const Quat& q, EulerOrder order) {
    double m[3][3];
    quatToMat3(q, m);
    const auto ax = axesFor(order);
    const double s = ax.parity;

    double out[3]{0.0, 0.0, 0.0};
    const double sinB = std::clamp(-s * m[ax.k][ax.i], -1.0, 1.0);
    out[ax.j] = std::asin(sinB);
    if (std::fabs(sinB) < 1.0 - 1e-12) {
        out[ax.i] = std::atan2(s * m[ax.k][ax.j], m[ax.k][ax.k]);
        out[ax.k] = std::atan2(s * m[ax.j][ax.i], m[ax.i][ax.i]);
    } else {
        // Gimbal lock: fold the whole remaining rotation into the first axis.
        out[ax.i] = std::atan2(-s * m[ax.j][ax.k], m[ax.j][ax.j]);
        out[ax.k] = 0.0;
    }
    return Vec3{out[0], out[1], out[2]};
}

SwingTwist swingTwist(const Quat& in, int axis) {
    const Quat q = normalized(in);
    const double axial = axis == 0 ? q.x : (axis == 1 ? q.y : q.z);
    SwingTwist out;
    double len = std::sqrt(q.w * q.w + axial * axial);
    if (len < 1e-12) {
        out.twist = 0.0;
        out.swing = q;
        return out;
    }
    Quat twist{q.w / len, 0.0, 0.0, 0.0};
    if (axis == 0) twist.x = axial / len;
    else if (axis == 1) twist.y = axial / len;
    else twist.z = axial / len;
    out.twist = 2.0 * std::atan2(axial / len, q.w / len);
    if (out.twist > std::numbers::pi) out.twist -= 2.0 * std::numbers::pi;
    if (out.twist < -std::numbers::pi) out.twist += 2.0 * std::numbers::pi;
    Quat inverseTwist{twist.w, -twist.x, -twist.y, -twist.z};
    out.swing = normalized(multiply(q, inverseTwist));
    return out;
}

double rotationalDifference(const Quat& a, const Quat& b) {
    const double d = std::clamp(std::fabs(dot(normalized(a), normalized(b))), 0.0, 1.0);
    return 2.0 * std::acos(d);
}

Mat4 Mat4::compose(const Vec3& location, const Quat& rotation, const Vec3& scale) {
    double r[3][3];
    quatToMat3(rotation, r);
    Mat4 out = identity();
    const double s[3]{scale.x, scale.y, scale.z};
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            out.a.a[row][col] = r[row][col] * s[col];
        }
    }
    out.a.a[0][3] = location.x;
    out.a.a[1][3] = location.y;
    out.a.a[2][3] = location.z;
    return out;
}

Vec3 Mat4::scale() const {
    auto column = [&](int c) {
        return std::sqrt(a.a[0][c] * a.a[0][c] + a.a[1][c] * a.a[1][c] + a.a[2][c] * a.a[2][c]);
    };
    return Vec3{column(0), column(1), column(2)};
}

Quat Mat4::rotation() const {
    const Vec3 s = scale();
    const double sc[3]{s.x, s.y, s.z};
    boost::qvm::mat<double, 3, 3> r;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            r.a[row][col] = sc[col] == 0.0 ? 0.0 : a.a[row][col] / sc[col];
        }
    }
    return normalized(Quat::fromQvm(boost::qvm::convert_to<boost::qvm::quat<double>>(r)));
}

} // namespace cskit::core::math
