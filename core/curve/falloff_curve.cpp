#include "falloff_curve.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace cskit::core::curve {

namespace {
double clamp01(double v) {
    return std::clamp(v, 0.0, 1.0);
}

bool isExtremum(const std::vector<FalloffPoint>& pts, std::size_t i) {
    if (i == 0 || i + 1 >= pts.size()) return true;
    const double y = pts[i].co.y;
    const double prev = pts[i - 1].co.y;
    const double next = pts[i + 1].co.y;
    return (y >= prev && y >= next) || (y <= prev && y <= next);
}
} // namespace

FalloffCurve::FalloffCurve() {
    reset(FalloffPreset::Linear);
}

FalloffCurve::FalloffCurve(FalloffPreset preset) {
    reset(preset);
}

void FalloffCurve::reset(FalloffPreset preset) {
    switch (preset) {
    case FalloffPreset::Linear:
        points_ = {{{0.0, 0.0}, FalloffHandle::Auto}, {{1.0, 1.0}, FalloffHandle::Auto}};
        break;
    case FalloffPreset::EaseIn:
        points_ = {{{0.0, 0.0}, FalloffHandle::AutoClamped}, {{1.0, 1.0}, FalloffHandle::Auto}};
        break;
    case FalloffPreset::EaseOut:
        points_ = {{{0.0, 0.0}, FalloffHandle::Auto}, {{1.0, 1.0}, FalloffHandle::AutoClamped}};
        break;
    case FalloffPreset::EaseInOut:
        points_ = {{{0.0, 0.0}, FalloffHandle::AutoClamped}, {{1.0, 1.0}, FalloffHandle::AutoClamped}};
        break;
    case FalloffPreset::Smooth:
        points_ = {{{0.0, 0.0}, FalloffHandle::AutoClamped},
                   {{0.5, 0.5}, FalloffHandle::Auto},
                   {{1.0, 1.0}, FalloffHandle::AutoClamped}};
        break;
    }
}

void FalloffCurve::sortPoints() {
    std::stable_sort(points_.begin(), points_.end(), [](const FalloffPoint& a, const FalloffPoint& b) {
        return a.co.x < b.co.x;
    });
}

void FalloffCurve::setPoints(std::vector<FalloffPoint> pts) {
    if (pts.size() < 2) {
        throw std::invalid_argument("FalloffCurve.setPoints: at least two points are required");
    }
    for (auto& p : pts) {
        p.co.x = clamp01(p.co.x);
        p.co.y = clamp01(p.co.y);
    }
    points_ = std::move(pts);
    sortPoints();
}

std::size_t FalloffCurve::insertPoint(double x, double y) {
    FalloffPoint p{{clamp01(x), clamp01(y)}, FalloffHandle::Auto};
    auto it = std::upper_bound(points_.begin(), points_.end(), p, [](const FalloffPoint& a, const FalloffPoint& b) {
        return a.co.x < b.co.x;
    });
    it = points_.insert(it, p);
    return static_cast<std::size_t>(it - points_.begin());
}

void FalloffCurve::removePoint(std::size_t index) {
    if (index >= points_.size()) {
        throw std::out_of_range("FalloffCurve.removePoint: index " + std::to_string(index) +
                                " out of range 0-" + std::to_string(points_.size()));
    }
    if (points_.size() <= 2) {
        throw std::runtime_error("FalloffCurve.removePoint: a curve needs at least two points");
    }
    if (index == 0 || index + 1 == points_.size()) {
        throw std::invalid_argument("FalloffCurve.removePoint: the end points cannot be removed");
    }
    points_.erase(points_.begin() + static_cast<std::ptrdiff_t>(index));
}

void FalloffCurve::movePoint(std::size_t index, double x, double y) {
    if (index >= points_.size()) {
        throw std::out_of_range("FalloffCurve.movePoint: index " + std::to_string(index) +
                                " out of range 0-" + std::to_string(points_.size()));
    }
    double lo = 0.0;
    double hi = 1.0;
    if (index > 0) lo = points_[index - 1].co.x;
    if (index + 1 < points_.size()) hi = points_[index + 1].co.x;
    points_[index].co.x = std::clamp(x, lo, hi);
    points_[index].co.y = clamp01(y);
}

void FalloffCurve::setHandleType(std::size_t index, FalloffHandle handle) {
    if (index >= points_.size()) {
        throw std::out_of_range("FalloffCurve.setHandleType: index " + std::to_string(index) +
                                " out of range 0-" + std::to_string(points_.size()));
    }
    points_[index].handle = handle;
}

std::vector<Keyframe> FalloffCurve::keyframes() const {
    std::vector<Keyframe> out;
    out.reserve(points_.size());
    const std::size_t n = points_.size();
    for (std::size_t i = 0; i < n; ++i) {
        const Point co = points_[i].co;
        const bool hasPrev = i > 0;
        const bool hasNext = i + 1 < n;
        const Point prev = hasPrev ? points_[i - 1].co : Point{};
        const Point next = hasNext ? points_[i + 1].co : Point{};

        double dxPrev = hasPrev ? co.x - prev.x : (hasNext ? next.x - co.x : 0.0);
        double dxNext = hasNext ? next.x - co.x : dxPrev;

        Keyframe key;
        key.co = co;
        key.interpolation = Interpolation::Bezier;
        key.handleLeftType = HandleType::Free;
        key.handleRightType = HandleType::Free;

        if (points_[i].handle == FalloffHandle::Vector) {
            const Point towardPrev = hasPrev ? prev : Point{co.x - (next.x - co.x), co.y - (next.y - co.y)};
            const Point towardNext = hasNext ? next : Point{co.x + (co.x - prev.x), co.y + (co.y - prev.y)};
            key.handleLeft = Point{co.x + (towardPrev.x - co.x) / 3.0, co.y + (towardPrev.y - co.y) / 3.0};
            key.handleRight = Point{co.x + (towardNext.x - co.x) / 3.0, co.y + (towardNext.y - co.y) / 3.0};
            out.push_back(key);
            continue;
        }

        double slope = 0.0;
        if (hasPrev && hasNext) {
            const double span = next.x - prev.x;
            slope = span == 0.0 ? 0.0 : (next.y - prev.y) / span;
        } else if (hasNext) {
            slope = dxNext == 0.0 ? 0.0 : (next.y - co.y) / dxNext;
        } else if (hasPrev) {
            slope = dxPrev == 0.0 ? 0.0 : (co.y - prev.y) / dxPrev;
        }
        if (points_[i].handle == FalloffHandle::AutoClamped && isExtremum(points_, i)) {
            slope = 0.0;
        }

        key.handleLeft = Point{co.x - dxPrev / 3.0, co.y - slope * dxPrev / 3.0};
        key.handleRight = Point{co.x + dxNext / 3.0, co.y + slope * dxNext / 3.0};
        out.push_back(key);
    }
    return out;
}

double FalloffCurve::sample(double x) const {
    KeyframeCurve curve(keyframes(), Extrapolation::Constant);
    return curve.evaluate(clamp01(x));
}

KeyframeCurve FalloffCurve::toBezier(const Range& xRange, const Range& yRange, bool extrapolate) const {
    const double xs = xRange.max - xRange.min;
    const double ys = yRange.max - yRange.min;
    auto remap = [&](const Point& p) {
        return Point{xRange.min + p.x * xs, yRange.min + p.y * ys};
    };
    std::vector<Keyframe> keys = keyframes();
    for (auto& key : keys) {
        key.co = remap(key.co);
        key.handleLeft = remap(key.handleLeft);
        key.handleRight = remap(key.handleRight);
    }
    return KeyframeCurve(std::move(keys), extrapolate ? Extrapolation::Linear : Extrapolation::Constant);
}

const char* presetName(FalloffPreset preset) {
    switch (preset) {
    case FalloffPreset::Linear: return "LINEAR";
    case FalloffPreset::EaseIn: return "EASE_IN";
    case FalloffPreset::EaseOut: return "EASE_OUT";
    case FalloffPreset::EaseInOut: return "EASE_IN_OUT";
    case FalloffPreset::Smooth: return "SMOOTH";
    }
    return "LINEAR";
}

bool parsePreset(const std::string& name, FalloffPreset& out) {
    for (auto p : {FalloffPreset::Linear, FalloffPreset::EaseIn, FalloffPreset::EaseOut,
                   FalloffPreset::EaseInOut, FalloffPreset::Smooth}) {
        if (name == presetName(p)) {
            out = p;
            return true;
        }
    }
    return false;
}

const char* handleName(FalloffHandle handle) {
    switch (handle) {
    case FalloffHandle::Auto: return "AUTO";
    case FalloffHandle::AutoClamped: return "AUTO_CLAMPED";
    case FalloffHandle::Vector: return "VECTOR";
    }
    return "AUTO";
}

bool parseHandle(const std::string& name, FalloffHandle& out) {
    for (auto h : {FalloffHandle::Auto, FalloffHandle::AutoClamped, FalloffHandle::Vector}) {
        if (name == handleName(h)) {
            out = h;
            return true;
        }
    }
    return false;
}

void FalloffCurve::serialize(serde::Serializer& serializer) const {
    std::vector<serde::Serializer> items;
    items.reserve(points_.size());
    for (const auto& p : points_) {
        serde::Serializer ps;
        ps.putKey("x");
        ps.putValue(p.co.x);
        ps.putKey("y");
        ps.putValue(p.co.y);
        ps.putKey("handle_type");
        ps.putValue(std::string(handleName(p.handle)));
        items.push_back(std::move(ps));
    }
    serializer.putList("points", items);
}

serde::SerdeException FalloffCurve::deserializeFromFghj(const serde::Fghj& data) {
    try {
        std::vector<FalloffPoint> pts;
        if (auto list = data.get_child_optional("points")) {
            for (const auto& item : *list) {
                FalloffPoint p;
                p.co.x = item.second.get<double>("x");
                p.co.y = item.second.get<double>("y");
                if (auto h = item.second.get_optional<std::string>("handle_type")) {
                    if (!parseHandle(*h, p.handle)) return "unknown handle type: " + *h;
                }
                pts.push_back(p);
            }
        }
        setPoints(std::move(pts));
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

} // namespace cskit::core::curve
