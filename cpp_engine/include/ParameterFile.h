#pragma once

#include <string>

#include "Ecosystem.h"

namespace ecodyn {

// Parameter set plus run options as read from a .props file.
struct ParameterFile {
    SimulationParameters parameters{};
    double horizon = kDefaultHorizon;  // optional key run.horizon
};

// `key = value` per line, '#' comments. Every prey.*, predator.* and
// environment.* key is required; unknown keys are rejected. On failure
// returns InvalidParameters and, if `error` is non-null, a message naming
// the offending key or line.
EngineStatus parseParameterText(const std::string& text, ParameterFile* out, std::string* error);

EngineStatus loadParameterFile(const std::string& path, ParameterFile* out, std::string* error);

// Inverse of parseParameterText; values are written with round-trip precision.
std::string formatParameterText(const SimulationParameters& p, double horizon = kDefaultHorizon);

} // namespace ecodyn
