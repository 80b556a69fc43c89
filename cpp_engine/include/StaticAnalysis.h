#pragma once

#include <vector>

#include "Ecosystem.h"

namespace ecodyn {

// Closed-form estimate from the un-forced isoclines. Ignores the logistic and
// starvation terms, so it is a heuristic starting point, not a guarantee that
// a run settles there (or settles at all).
struct EquilibriumPrediction {
    double prey = 0.0;
    double predator = 0.0;
    bool is_stable = false;
};

struct PhaseSpaceSample {
    double x = 0.0;   // prey
    double y = 0.0;   // predator
    double dx = 0.0;  // dPrey/dt
    double dy = 0.0;  // dPredator/dt
};

// DivisionByZero when hunting_efficiency (or carrying_capacity) is zero;
// `out` is untouched on failure.
EngineStatus predictEquilibrium(const SimulationParameters& p, EquilibriumPrediction* out);

// resolution*resolution samples, prey outer / predator inner, over
// [0, K) x [0, 10 * predator initial population) at the base resource level.
EngineStatus samplePhaseSpace(const SimulationParameters& p, int resolution,
                              std::vector<PhaseSpaceSample>* out);

} // namespace ecodyn
