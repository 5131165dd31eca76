#pragma once

#include "../host/channel_store.hpp"

#include <string>
#include <vector>

namespace cskit::core::synth {

enum class ActivationMode {
    Multiply,
    Min,
    Max,
    Average,
};

const char* activationModeName(ActivationMode mode);
bool parseActivationMode(const std::string& name, ActivationMode& out);

// Data path of one slot of a mesh custom array, e.g. `["csk_abc"][2]`.
std::string arraySlotPath(const std::string& arrayName, int slot);

/**
 * Scripted driver combining per-driver weights into a target activation.
 *
 * One binding `d<i>` per entry of `slots`, each reading the mesh array
 * `arrayName` at that slot. Multiply and Average are scripted expressions
 * (`1.0` and `0.0` with no inputs); Min and Max use the native reduction.
 */
host::ScriptedDriver synthesizeCombination(ActivationMode mode, const std::string& meshName,
                                           const std::string& arrayName, const std::vector<int>& slots);

} // namespace cskit::core::synth
