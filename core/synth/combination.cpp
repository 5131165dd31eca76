#include "combination.hpp"

#include "../common/utils.hpp"
#include "../debug_log.hpp"

namespace cskit::core::synth {

const char* activationModeName(ActivationMode mode) {
    switch (mode) {
    case ActivationMode::Multiply: return "MULTIPLY";
    case ActivationMode::Min: return "MIN";
    case ActivationMode::Max: return "MAX";
    case ActivationMode::Average: return "AVERAGE";
    }
    return "MULTIPLY";
}

bool parseActivationMode(const std::string& name, ActivationMode& out) {
    for (auto m : {ActivationMode::Multiply, ActivationMode::Min, ActivationMode::Max, ActivationMode::Average}) {
        if (name == activationModeName(m)) {
            out = m;
            return true;
        }
    }
    return false;
}

std::string arraySlotPath(const std::string& arrayName, int slot) {
    return "[\"" + arrayName + "\"][" + std::to_string(slot) + "]";
}

host::ScriptedDriver synthesizeCombination(ActivationMode mode, const std::string& meshName,
                                           const std::string& arrayName, const std::vector<int>& slots) {
    host::ScriptedDriver driver;
    std::vector<std::string> names;
    names.reserve(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        host::DriverBinding binding;
        binding.name = "d" + std::to_string(i);
        binding.kind = host::BindingKind::SingleProp;
        binding.targets.push_back(host::PropertyRef{host::IdType::Mesh, meshName, arraySlotPath(arrayName, slots[i])});
        names.push_back(binding.name);
        driver.bindings.push_back(std::move(binding));
    }

    switch (mode) {
    case ActivationMode::Multiply:
        driver.type = host::DriverType::Scripted;
        driver.expression = names.empty() ? "1.0" : common::join(names, "*");
        break;
    case ActivationMode::Average:
        driver.type = host::DriverType::Scripted;
        driver.expression = names.empty()
            ? "0.0"
            : "(" + common::join(names, "+") + ")/" + common::formatDecimal(static_cast<double>(names.size()));
        break;
    case ActivationMode::Min:
        driver.type = host::DriverType::Min;
        break;
    case ActivationMode::Max:
        driver.type = host::DriverType::Max;
        break;
    }
    CSKIT_DBG_LOG("[cskit] combination %s over %zu drivers\n", activationModeName(mode), slots.size());
    return driver;
}

} // namespace cskit::core::synth
