#pragma once

#include <boost/qvm/mat.hpp>
#include <boost/qvm/mat_operations.hpp>
#include <boost/qvm/quat.hpp>
#include <boost/qvm/quat_operations.hpp>

#include <cmath>

namespace cskit::core::math {

struct Vec3 {
    double x{0.0};
    double y{0.0};
    double z{0.0};

    double operator[](int axis) const { return axis == 0 ? x : (axis == 1 ? y : z); }
};

inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline double length(const Vec3& v) { return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z); }

// w first, matching the storage order of boost::qvm::quat.
struct Quat {
    double w{1.0};
    double x{0.0};
    double y{0.0};
    double z{0.0};

    double operator[](int i) const { return i == 0 ? w : (i == 1 ? x : (i == 2 ? y : z)); }

    boost::qvm::quat<double> toQvm() const {
        boost::qvm::quat<double> q;
        q.a[0] = w;
        q.a[1] = x;
        q.a[2] = y;
        q.a[3] = z;
        return q;
    }

    static Quat fromQvm(const boost::qvm::quat<double>& q) { return Quat{q.a[0], q.a[1], q.a[2], q.a[3]}; }
};

struct Mat4 {
    boost::qvm::mat<double, 4, 4> a{};

    double* operator[](int row) { return a.a[row]; }
    const double* operator[](int row) const { return a.a[row]; }

    static Mat4 identity() {
        Mat4 out{};
        out.a = boost::qvm::identity_mat<double, 4>();
        return out;
    }

    static Mat4 multiply(const Mat4& lhs, const Mat4& rhs) {
        Mat4 out{};
        out.a = boost::qvm::operator*(lhs.a, rhs.a);
        return out;
    }

    // Translation * Rotation * Scale.
    static Mat4 compose(const Vec3& location, const Quat& rotation, const Vec3& scale);

    Vec3 translation() const { return Vec3{a.a[0][3], a.a[1][3], a.a[2][3]}; }
    Vec3 scale() const;
    Quat rotation() const;
};

} // namespace cskit::core::math
