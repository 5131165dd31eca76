#include "session.hpp"

#include "../debug_log.hpp"

namespace cskit::core::ops {

const char* reportLevelName(ReportLevel level) {
    switch (level) {
    case ReportLevel::Info: return "INFO";
    case ReportLevel::Warning: return "WARNING";
    case ReportLevel::Error: return "ERROR";
    }
    return "INFO";
}

void VariableClipboard::serialize(serde::Serializer& serializer) const {
    std::vector<serde::Serializer> list;
    for (const auto& item : items_) {
        serde::Serializer s;
        item.serialize(s);
        list.push_back(std::move(s));
    }
    serializer.putList("variables", list);
}

serde::SerdeException VariableClipboard::deserializeFromFghj(const serde::Fghj& data) {
    std::vector<model::VariableState> loaded;
    if (auto list = data.get_child_optional("variables")) {
        for (const auto& item : *list) {
            model::VariableState state;
            if (auto err = state.deserializeFromFghj(item.second)) return err;
            loaded.push_back(std::move(state));
        }
    }
    items_ = std::move(loaded);
    return std::nullopt;
}

void CurveClipboard::serialize(serde::Serializer& serializer) const {
    if (!curve_) return;
    serde::Serializer cs;
    curve_->serialize(cs);
    serializer.putChild("curve", cs);
}

serde::SerdeException CurveClipboard::deserializeFromFghj(const serde::Fghj& data) {
    auto child = data.get_child_optional("curve");
    if (!child) {
        curve_.reset();
        return std::nullopt;
    }
    curve::FalloffCurve loaded;
    if (auto err = loaded.deserializeFromFghj(*child)) return err;
    curve_ = loaded;
    return std::nullopt;
}

Session::Session(EngineConfig config) : config_(config), registry_(config) {}

void Session::setReportCallback(ReportFn callback, void* userData) {
    reportFn_ = callback;
    reportUserData_ = userData;
}

void Session::report(ReportLevel level, const std::string& message) const {
    if (reportFn_) {
        reportFn_(level, message.c_str(), message.size(), reportUserData_);
        return;
    }
    CSKIT_DBG_LOG("[cskit] %s: %s\n", reportLevelName(level), message.c_str());
}

} // namespace cskit::core::ops
