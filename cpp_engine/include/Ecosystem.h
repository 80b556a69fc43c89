#pragma once

#include <cstdint>
#include <vector>

namespace ecodyn {

// ============================================================
// Behavioral constants (fixed contract; changing any of these changes
// recorded trajectories and therefore run signatures)
// ============================================================
constexpr double kFixedDt               = 0.01;   // integration step (time units)
constexpr double kRecordInterval        = 0.1;    // record cadence (time units)
constexpr double kDefaultHorizon        = 100.0;  // run length unless overridden
constexpr double kPostEquilibriumGrace  = 10.0;   // time kept after first stable window

constexpr int    kEquilibriumWindow     = 50;     // recorded samples
constexpr double kEquilibriumTolerance  = 0.01;   // coefficient of variation

constexpr double kPredationCredit       = 0.5;    // prey eaten -> predator growth
constexpr double kStarvationThreshold   = 10.0;   // prey count below which predators starve
constexpr double kStarvationMultiplier  = 2.0;    // death-rate amplification when starving
constexpr double kExtinctionThreshold   = 1.0;    // individuals

constexpr double kSeasonPeriod          = 12.0;   // one annual cycle in time units
constexpr int    kDefaultBatchSteps     = 10;     // micro-steps per stepwise batch
constexpr double kPredictorPreyCap      = 0.8;    // fraction of carrying capacity

enum class EngineStatus : int {
    Ok                = 0,
    InvalidParameters = 1,
    DivisionByZero    = 2,
    NumericDegeneracy = 3,
    NotConfigured     = 4,
};

const char* statusName(EngineStatus s);

struct PreyParameters {
    double initial_population = 0.0;
    double birth_rate = 0.0;          // per time unit
    double carrying_capacity = 0.0;   // individuals
};

struct PredatorParameters {
    double initial_population = 0.0;
    double hunting_efficiency = 0.0;  // per prey per predator per time unit
    double death_rate = 0.0;          // per time unit
};

struct EnvironmentParameters {
    double resource_availability = 0.0;  // 0..1
    bool   seasonal_variation = false;
    double seasonal_amplitude = 0.0;
};

struct SimulationParameters {
    PreyParameters prey{};
    PredatorParameters predator{};
    EnvironmentParameters environment{};
};

struct SimulationState {
    double time = 0.0;
    double prey = 0.0;
    double predator = 0.0;
};

struct PopulationRates {
    double d_prey = 0.0;
    double d_predator = 0.0;
};

// Output precision: time to 2 decimals, populations to 1 decimal.
struct TimeStepRecord {
    double time = 0.0;
    double prey_population = 0.0;
    double predator_population = 0.0;
    double resource_level = 0.0;
};

struct EquilibriumPoint {
    double prey_mean = 0.0;
    double predator_mean = 0.0;
    double time_reached = 0.0;
};

struct SimulationSummary {
    double duration = 0.0;
    double max_prey = 0.0;
    double max_predator = 0.0;
    double min_prey = 0.0;
    double min_predator = 0.0;
    double final_prey = 0.0;      // full precision
    double final_predator = 0.0;  // full precision
    double average_resource_level = 0.0;
};

struct SimulationResult {
    std::vector<TimeStepRecord> time_steps;
    bool equilibrium_reached = false;
    EquilibriumPoint equilibrium_point{};  // valid iff equilibrium_reached
    bool extinction_occurred = false;
    SimulationSummary summary{};
};

// Rejects non-finite or negative fields and resource availability above 1
// (InvalidParameters), then a zero carrying capacity (DivisionByZero).
EngineStatus validateParameters(const SimulationParameters& p);

// Resource level at time t, always within [0,1] for validated parameters.
double resourceLevel(const EnvironmentParameters& env, double t);

// Modified Lotka-Volterra right-hand side. Caller guarantees carrying_capacity > 0.
PopulationRates populationRates(double prey, double predator, double resource_level,
                                const SimulationParameters& p);

// One classic RK4 step. The resource level is sampled once at s.time and held
// for all four stages. Populations are floor-clamped at zero; the returned
// state carries time s.time + dt.
SimulationState integrateStep(const SimulationState& s, const SimulationParameters& p, double dt);

// Round half up, matching the recorded-output precision.
double roundTo(double v, int decimals);

TimeStepRecord makeRecord(const SimulationState& s, const EnvironmentParameters& env);

} // namespace ecodyn
