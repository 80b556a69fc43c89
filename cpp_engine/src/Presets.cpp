#include "Presets.h"

#include <algorithm>
#include <cctype>

namespace ecodyn {

namespace {

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

Preset makePreset(const char* key, const char* name, const char* description,
                  PreyParameters prey, PredatorParameters predator, EnvironmentParameters env) {
    Preset p;
    p.key = key;
    p.name = name;
    p.description = description;
    p.parameters.prey = prey;
    p.parameters.predator = predator;
    p.parameters.environment = env;
    return p;
}

std::vector<Preset> buildPresets() {
    std::vector<Preset> v;
    v.push_back(makePreset("balanced", "Balanced Ecosystem",
                           "A stable ecosystem with moderate populations",
                           {1000.0, 1.0, 5000.0}, {100.0, 0.01, 0.5}, {0.7, false, 0.2}));
    v.push_back(makePreset("predator_dominant", "Predator Dominant",
                           "High predator pressure leading to potential prey extinction",
                           {500.0, 0.8, 3000.0}, {200.0, 0.02, 0.3}, {0.5, false, 0.2}));
    v.push_back(makePreset("boom_and_bust", "Boom and Bust",
                           "Cyclic populations with seasonal variation",
                           {2000.0, 1.5, 8000.0}, {50.0, 0.015, 0.6}, {0.6, true, 0.4}));
    v.push_back(makePreset("resource_scarcity", "Resource Scarcity",
                           "Limited resources constraining population growth",
                           {800.0, 0.6, 2000.0}, {80.0, 0.008, 0.7}, {0.3, false, 0.1}));
    return v;
}

} // namespace

const std::vector<Preset>& builtinPresets() {
    static const std::vector<Preset> presets = buildPresets();
    return presets;
}

bool findPreset(const std::string& key_or_name, Preset* out) {
    const std::string needle = toLower(key_or_name);
    for (const auto& p : builtinPresets()) {
        if (p.key == needle || toLower(p.name) == needle) {
            if (out) *out = p;
            return true;
        }
    }
    return false;
}

} // namespace ecodyn
