#pragma once

#include "../config.hpp"
#include "../curve/falloff_curve.hpp"
#include "../model/manager.hpp"
#include "../model/variable.hpp"
#include "../serde.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cskit::core::ops {

enum class ReportLevel {
    Info,
    Warning,
    Error,
};

using ReportFn = void (*)(ReportLevel level, const char* message, std::size_t length, void* userData);

const char* reportLevelName(ReportLevel level);

// Variables copied from one driver for pasting into another.
class VariableClipboard {
public:
    void clear() { items_.clear(); }
    void store(std::vector<model::VariableState> items) { items_ = std::move(items); }
    const std::vector<model::VariableState>& items() const { return items_; }
    bool empty() const { return items_.empty(); }

    void serialize(serde::Serializer& serializer) const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

private:
    std::vector<model::VariableState> items_{};
};

// Falloff control points copied from one target.
class CurveClipboard {
public:
    void clear() { curve_.reset(); }
    void store(const curve::FalloffCurve& curve) { curve_ = curve; }
    const std::optional<curve::FalloffCurve>& curve() const { return curve_; }
    bool empty() const { return !curve_.has_value(); }

    void serialize(serde::Serializer& serializer) const;
    serde::SerdeException deserializeFromFghj(const serde::Fghj& data);

private:
    std::optional<curve::FalloffCurve> curve_{};
};

/**
 * Application-level state shared by the operators: configuration, the
 * per-mesh managers, both clipboards and the report sink.
 */
class Session {
public:
    explicit Session(EngineConfig config = {});

    const EngineConfig& config() const { return config_; }
    model::ManagerRegistry& registry() { return registry_; }
    VariableClipboard& variableClipboard() { return variables_; }
    CurveClipboard& curveClipboard() { return curves_; }

    // With no callback, reports go to the debug log.
    void setReportCallback(ReportFn callback, void* userData);
    void report(ReportLevel level, const std::string& message) const;

private:
    EngineConfig config_{};
    model::ManagerRegistry registry_;
    VariableClipboard variables_{};
    CurveClipboard curves_{};
    ReportFn reportFn_{nullptr};
    void* reportUserData_{nullptr};
};

} // namespace cskit::core::ops
