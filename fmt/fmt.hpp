#pragma once

#include "serialize.hpp"
#include "../core/config.hpp"
#include "../core/host/host_context.hpp"
#include "../core/model/manager.hpp"

#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace cskit::fmt {

// Loads a manager document bound to `host`. Nothing is synthesized; call
// Manager::updateAll() to rebuild the host channels.
inline std::shared_ptr<core::model::Manager> inLoadManagerFromMemory(const std::string& data,
                                                                     const core::host::HostContext& host,
                                                                     const core::EngineConfig& config = {}) {
    auto manager = std::make_shared<core::model::Manager>(host, config);
    if (auto err = inFromJson(*manager, data)) {
        throw std::runtime_error("Invalid combination shape key document: " + *err);
    }
    return manager;
}

inline std::shared_ptr<core::model::Manager> inLoadManager(const std::string& file,
                                                           const core::host::HostContext& host,
                                                           const core::EngineConfig& config = {}) {
    std::ifstream ifs(file);
    if (!ifs) {
        throw std::runtime_error("Failed to open combination shape key document: " + file);
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return inLoadManagerFromMemory(buffer.str(), host, config);
}

inline void inSaveManager(const core::model::Manager& manager, const std::string& file) {
    std::ofstream ofs(file);
    if (!ofs) {
        throw std::runtime_error("Failed to write combination shape key document: " + file);
    }
    ofs << inToJsonPretty(manager);
}

} // namespace cskit::fmt
