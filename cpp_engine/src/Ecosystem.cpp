#include "Ecosystem.h"

#include <algorithm>
#include <cmath>

namespace ecodyn {

namespace {

constexpr double kTwoPi = 6.283185307179586;

static inline bool finiteNonNegative(double x) {
    return std::isfinite(x) && x >= 0.0;
}

} // namespace

const char* statusName(EngineStatus s) {
    switch (s) {
        case EngineStatus::Ok:                return "ok";
        case EngineStatus::InvalidParameters: return "invalid_parameters";
        case EngineStatus::DivisionByZero:    return "division_by_zero";
        case EngineStatus::NumericDegeneracy: return "numeric_degeneracy";
        case EngineStatus::NotConfigured:     return "not_configured";
    }
    return "unknown";
}

EngineStatus validateParameters(const SimulationParameters& p) {
    const double fields[] = {
        p.prey.initial_population,
        p.prey.birth_rate,
        p.prey.carrying_capacity,
        p.predator.initial_population,
        p.predator.hunting_efficiency,
        p.predator.death_rate,
        p.environment.resource_availability,
        p.environment.seasonal_amplitude,
    };
    for (double v : fields) {
        if (!finiteNonNegative(v)) return EngineStatus::InvalidParameters;
    }
    if (p.environment.resource_availability > 1.0) return EngineStatus::InvalidParameters;

    // Logistic term divides by K.
    if (p.prey.carrying_capacity == 0.0) return EngineStatus::DivisionByZero;
    return EngineStatus::Ok;
}

double resourceLevel(const EnvironmentParameters& env, double t) {
    const double base = env.resource_availability;
    if (!env.seasonal_variation) {
        return base;
    }
    const double seasonal = std::sin(kTwoPi * t / kSeasonPeriod);
    return std::max(0.0, std::min(1.0, base + env.seasonal_amplitude * seasonal));
}

PopulationRates populationRates(double prey, double predator, double resource_level,
                                const SimulationParameters& p) {
    const double effective_birth = p.prey.birth_rate * resource_level;

    const double growth = effective_birth * prey;
    const double predation = p.predator.hunting_efficiency * prey * predator;
    const double competition = (p.prey.birth_rate * prey * prey) / p.prey.carrying_capacity;

    const double predator_growth = p.predator.hunting_efficiency * kPredationCredit * prey * predator;
    const double predator_death = p.predator.death_rate * predator;
    const double starvation = (prey < kStarvationThreshold) ? kStarvationMultiplier : 1.0;

    PopulationRates r;
    r.d_prey = growth - predation - competition;
    r.d_predator = predator_growth - predator_death * starvation;
    return r;
}

SimulationState integrateStep(const SimulationState& s, const SimulationParameters& p, double dt) {
    // Forcing is frozen within the micro-step.
    const double r = resourceLevel(p.environment, s.time);
    const double P = s.prey;
    const double Q = s.predator;

    const PopulationRates k1 = populationRates(P, Q, r, p);
    const PopulationRates k2 = populationRates(P + 0.5 * dt * k1.d_prey,
                                               Q + 0.5 * dt * k1.d_predator, r, p);
    const PopulationRates k3 = populationRates(P + 0.5 * dt * k2.d_prey,
                                               Q + 0.5 * dt * k2.d_predator, r, p);
    const PopulationRates k4 = populationRates(P + dt * k3.d_prey,
                                               Q + dt * k3.d_predator, r, p);

    const double prey_raw = P + (dt / 6) *
        (k1.d_prey + 2 * k2.d_prey + 2 * k3.d_prey + k4.d_prey);
    const double predator_raw = Q + (dt / 6) *
        (k1.d_predator + 2 * k2.d_predator + 2 * k3.d_predator + k4.d_predator);

    // Clamp negatives only; a NaN must reach the caller unmasked.
    SimulationState next;
    next.time = s.time + dt;
    next.prey = (prey_raw < 0.0) ? 0.0 : prey_raw;
    next.predator = (predator_raw < 0.0) ? 0.0 : predator_raw;
    return next;
}

double roundTo(double v, int decimals) {
    // Half rounds toward +inf. Adding 0.5 before floor() would carry
    // values just under one half across the boundary.
    const double scale = std::pow(10.0, decimals);
    const double x = v * scale;
    double r = std::floor(x);
    if (x - r >= 0.5) r += 1.0;
    return r / scale;
}

TimeStepRecord makeRecord(const SimulationState& s, const EnvironmentParameters& env) {
    TimeStepRecord rec;
    rec.time = roundTo(s.time, 2);
    rec.prey_population = roundTo(s.prey, 1);
    rec.predator_population = roundTo(s.predator, 1);
    rec.resource_level = resourceLevel(env, s.time);
    return rec;
}

} // namespace ecodyn
