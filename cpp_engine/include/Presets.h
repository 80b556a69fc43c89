#pragma once

#include <string>
#include <vector>

#include "Ecosystem.h"

namespace ecodyn {

struct Preset {
    std::string key;          // short lookup name, e.g. "boom_and_bust"
    std::string name;
    std::string description;
    SimulationParameters parameters{};
};

// Built once, in a fixed order.
const std::vector<Preset>& builtinPresets();

// Case-insensitive match on key or display name.
bool findPreset(const std::string& key_or_name, Preset* out);

} // namespace ecodyn
