#include "keyframe.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>

namespace cskit::core::curve {

namespace {
double findLocalMin01(const std::function<double(double)>& f) {
    // Brent minimisation on [0,1].
    constexpr double c = 0.38196601125010515; // (3-sqrt(5))/2
    constexpr double cm1 = 0.6180339887498949;
    const double relTolerance = std::sqrt(std::numeric_limits<double>::epsilon());
    const double absTolerance = std::sqrt(std::numeric_limits<double>::epsilon());

    double a = 0.0;
    double b = 1.0;
    double v = a * cm1 + b * c;
    double fv = f(v);
    if (!std::isfinite(fv)) {
        return std::clamp(v, 0.0, 1.0);
    }
    double w = v;
    double fw = fv;
    double x = v;
    double fx = fv;
    double d = 0.0;
    double e = 0.0;

    for (;;) {
        const double m = (a + b) * 0.5;
        const double tolerance = absTolerance * std::fabs(x) + relTolerance;
        const double t2 = tolerance * 2.0;
        if (!(std::fabs(x - m) > t2 - (b - a) * 0.5)) break;

        double p = 0.0;
        double q = 0.0;
        double r = 0.0;
        if (std::fabs(e) > tolerance) {
            const double xw = x - w;
            const double fxw = fx - fw;
            const double xv = x - v;
            const double fxv = fx - fv;
            const double xwfxv = xw * fxv;
            const double xvfxw = xv * fxw;
            p = xv * xvfxw - xw * xwfxv;
            q = (xvfxw - xwfxv) * 2.0;
            if (q > 0.0) p = -p; else q = -q;
            r = e;
            e = d;
        }

        double u = 0.0;
        if (std::fabs(p) < std::fabs(q * r * 0.5) && p > q * (a - x) && p < q * (b - x)) {
            d = p / q;
            u = x + d;
            if (u - a < t2 || b - u < t2) {
                d = x < m ? tolerance : -tolerance;
            }
        } else {
            e = (x < m ? b : a) - x;
            d = c * e;
        }

        u = x + (std::fabs(d) >= tolerance ? d : (d > 0.0 ? tolerance : -tolerance));
        const double fu = f(u);
        if (!std::isfinite(fu)) {
            return std::clamp(u, 0.0, 1.0);
        }

        if (fu <= fx) {
            if (u < x) b = x; else a = x;
            v = w; fv = fw;
            w = x; fw = fx;
            x = u; fx = fu;
        } else {
            if (u < x) a = u; else b = u;
            if (fu <= fw || w == x) {
                v = w; fv = fw;
                w = u; fw = fu;
            } else if (fu <= fv || v == x || v == w) {
                v = u; fv = fu;
            }
        }
    }
    return std::clamp(x, 0.0, 1.0);
}

double bezier(double p0, double p1, double p2, double p3, double t) {
    const double s = 1.0 - t;
    return s * s * s * p0 + 3.0 * s * s * t * p1 + 3.0 * s * t * t * p2 + t * t * t * p3;
}

double bezierDerivative(double p0, double p1, double p2, double p3, double t) {
    const double s = 1.0 - t;
    return 3.0 * s * s * (p1 - p0) + 6.0 * s * t * (p2 - p1) + 3.0 * t * t * (p3 - p2);
}

// Scales both inner handles down when together they overshoot the segment's x extent.
void correctHandles(const Point& p0, Point& p1, Point& p2, const Point& p3) {
    const double len = p3.x - p0.x;
    const double len1 = std::fabs(p1.x - p0.x);
    const double len2 = std::fabs(p3.x - p2.x);
    if (len1 + len2 == 0.0 || len1 + len2 <= len) return;
    const double fac = len / (len1 + len2);
    p1 = Point{p0.x + (p1.x - p0.x) * fac, p0.y + (p1.y - p0.y) * fac};
    p2 = Point{p3.x - (p3.x - p2.x) * fac, p3.y - (p3.y - p2.y) * fac};
}
} // namespace

double solveBezierX(const Point& p0, const Point& p1, const Point& p2, const Point& p3, double x) {
    if (x <= p0.x) return 0.0;
    if (x >= p3.x) return 1.0;
    double t = findLocalMin01([&](double s) {
        const double dx = bezier(p0.x, p1.x, p2.x, p3.x, s) - x;
        return dx * dx;
    });
    for (int i = 0; i < 3; ++i) {
        const double slope = bezierDerivative(p0.x, p1.x, p2.x, p3.x, t);
        if (slope == 0.0) break;
        const double next = t - (bezier(p0.x, p1.x, p2.x, p3.x, t) - x) / slope;
        if (!(next >= 0.0 && next <= 1.0)) break;
        t = next;
    }
    return t;
}

double KeyframeCurve::evaluateSegment(const Keyframe& a, const Keyframe& b, double x) {
    switch (a.interpolation) {
    case Interpolation::Constant:
        return a.co.y;
    case Interpolation::Linear: {
        const double span = b.co.x - a.co.x;
        if (span == 0.0) return a.co.y;
        const double t = (x - a.co.x) / span;
        return a.co.y + (b.co.y - a.co.y) * t;
    }
    case Interpolation::Bezier:
        break;
    }
    Point p1 = a.handleRight;
    Point p2 = b.handleLeft;
    correctHandles(a.co, p1, p2, b.co);
    const double t = solveBezierX(a.co, p1, p2, b.co, x);
    return bezier(a.co.y, p1.y, p2.y, b.co.y, t);
}

double KeyframeCurve::extrapolateBefore(double x) const {
    const Keyframe& first = keyframes.front();
    if (extrapolation == Extrapolation::Constant || keyframes.size() == 1) return first.co.y;
    double dx = 0.0;
    double dy = 0.0;
    if (first.interpolation == Interpolation::Bezier) {
        dx = first.co.x - first.handleLeft.x;
        dy = first.co.y - first.handleLeft.y;
    } else {
        dx = keyframes[1].co.x - first.co.x;
        dy = keyframes[1].co.y - first.co.y;
    }
    if (dx == 0.0) return first.co.y;
    return first.co.y + (dy / dx) * (x - first.co.x);
}

double KeyframeCurve::extrapolateAfter(double x) const {
    const Keyframe& last = keyframes.back();
    if (extrapolation == Extrapolation::Constant || keyframes.size() == 1) return last.co.y;
    const Keyframe& prev = keyframes[keyframes.size() - 2];
    double dx = 0.0;
    double dy = 0.0;
    if (prev.interpolation == Interpolation::Bezier) {
        dx = last.handleRight.x - last.co.x;
        dy = last.handleRight.y - last.co.y;
    } else {
        dx = last.co.x - prev.co.x;
        dy = last.co.y - prev.co.y;
    }
    if (dx == 0.0) return last.co.y;
    return last.co.y + (dy / dx) * (x - last.co.x);
}

double KeyframeCurve::evaluate(double x) const {
    if (keyframes.empty()) return 0.0;
    const Keyframe& first = keyframes.front();
    const Keyframe& last = keyframes.back();
    if (x < first.co.x) return extrapolateBefore(x);
    if (x >= last.co.x) return x == last.co.x ? last.co.y : extrapolateAfter(x);

    for (std::size_t i = 0; i + 1 < keyframes.size(); ++i) {
        const Keyframe& a = keyframes[i];
        const Keyframe& b = keyframes[i + 1];
        if (x == a.co.x) return a.co.y;
        if (x < b.co.x) return evaluateSegment(a, b, x);
    }
    return last.co.y;
}

} // namespace cskit::core::curve
