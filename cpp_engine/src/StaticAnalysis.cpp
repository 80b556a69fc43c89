#include "StaticAnalysis.h"

#include <algorithm>
#include <cmath>

namespace ecodyn {

namespace {
// Upper predator axis bound relative to the initial predator population.
constexpr double kPhasePredatorSpan = 10.0;
} // namespace

EngineStatus predictEquilibrium(const SimulationParameters& p, EquilibriumPrediction* out) {
    if (!out) return EngineStatus::InvalidParameters;
    const EngineStatus st = validateParameters(p);
    if (st != EngineStatus::Ok) return st;
    if (p.predator.hunting_efficiency == 0.0) return EngineStatus::DivisionByZero;

    const double prey_eq = p.predator.death_rate / (p.predator.hunting_efficiency * kPredationCredit);
    const double predator_eq =
        (p.prey.birth_rate * p.environment.resource_availability) / p.predator.hunting_efficiency;
    const double adjusted_prey_eq = std::min(prey_eq, p.prey.carrying_capacity * kPredictorPreyCap);

    if (!std::isfinite(adjusted_prey_eq) || !std::isfinite(predator_eq)) {
        return EngineStatus::NumericDegeneracy;
    }

    out->prey = adjusted_prey_eq;
    out->predator = predator_eq;
    out->is_stable = adjusted_prey_eq > 0.0 && predator_eq > 0.0;
    return EngineStatus::Ok;
}

EngineStatus samplePhaseSpace(const SimulationParameters& p, int resolution,
                              std::vector<PhaseSpaceSample>* out) {
    if (!out || resolution < 1) return EngineStatus::InvalidParameters;
    const EngineStatus st = validateParameters(p);
    if (st != EngineStatus::Ok) return st;

    const double prey_range = p.prey.carrying_capacity;
    const double predator_range = p.predator.initial_population * kPhasePredatorSpan;
    const double base_resource = p.environment.resource_availability;

    std::vector<PhaseSpaceSample> grid;
    grid.reserve(static_cast<std::size_t>(resolution) * static_cast<std::size_t>(resolution));
    for (int i = 0; i < resolution; ++i) {
        const double prey = (static_cast<double>(i) / resolution) * prey_range;
        for (int j = 0; j < resolution; ++j) {
            const double predator = (static_cast<double>(j) / resolution) * predator_range;
            const PopulationRates r = populationRates(prey, predator, base_resource, p);
            grid.push_back({prey, predator, r.d_prey, r.d_predator});
        }
    }
    out->swap(grid);
    return EngineStatus::Ok;
}

} // namespace ecodyn
