#pragma once

#include <cstdint>
#include <vector>

#include "Ecosystem.h"
#include "Monitors.h"

namespace ecodyn {

struct RunSignatures {
    std::uint32_t param_hash_u32      = 0; // FNV-1a32 over effective parameters
    std::uint32_t trajectory_crc_u32  = 0; // CRC32 over appended TimeStepRecords
    std::uint32_t record_count_u32    = 0;
};

// Read-only snapshot for hosts (progress frames, polling).
struct Observation {
    double time = 0.0;
    double prey = 0.0;
    double predator = 0.0;
    double resource_level = 0.0;
    double horizon = 0.0;
    std::uint64_t micro_steps = 0;
    bool equilibrium_reached = false;
    bool extinction_occurred = false;
    bool concluded = false;
};

// FNV-1a32 over the parameter fields in declaration order.
std::uint32_t parameterHash(const SimulationParameters& p);

// One simulation run. Owns state, monitors and the recorded trajectory; no
// globals, so independent instances may run on different threads.
//
// Two ways to drive it:
// - runToCompletion(): loop to the horizon (or extinction) and build the result.
// - advanceBatch(): caller-paced micro-step batches, then finish().
// Both use the same per-step body, so a stepwise run driven to the end yields
// the same records as runToCompletion().
class Simulation {
public:
    Simulation();

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Invalid parameters or horizon are rejected without touching the current run.
    EngineStatus reset(const SimulationParameters& p);
    EngineStatus reset(const SimulationParameters& p, double horizon);

    EngineStatus runToCompletion(SimulationResult* out);

    // Up to `steps` micro-steps; stops early on extinction or at the horizon.
    // Concluded runs are left untouched. `out` may be null.
    EngineStatus advanceBatch(int steps, SimulationState* out);
    EngineStatus advanceBatch(SimulationState* out) { return advanceBatch(kDefaultBatchSteps, out); }

    // Appends the final record (once) and builds the summary. Idempotent.
    EngineStatus finish(SimulationResult* out);

    // Must be side-effect free and NaN-safe.
    Observation observe() const;

    const SimulationState& state() const noexcept { return state_; }
    const SimulationParameters& parameters() const noexcept { return params_; }
    const std::vector<TimeStepRecord>& records() const noexcept { return records_; }

    bool isConfigured() const noexcept { return configured_; }
    bool isConcluded() const noexcept;
    bool isFinished() const noexcept { return finished_; }
    bool equilibriumReached() const noexcept { return equilibrium_reached_; }
    bool extinctionOccurred() const noexcept { return extinction_occurred_; }
    const EquilibriumPoint& equilibriumPoint() const noexcept { return equilibrium_point_; }
    double horizon() const noexcept { return horizon_; }

    RunSignatures getRunSignatures() const { return signatures_; }

private:
    EngineStatus microStep();
    void appendRecord();
    void buildResult(SimulationResult* out) const;

    SimulationParameters params_{};
    SimulationState state_{};

    bool configured_ = false;
    bool finished_ = false;
    bool degenerate_ = false;

    double horizon_ = kDefaultHorizon;
    double last_record_time_ = 0.0;
    std::uint64_t micro_steps_ = 0;

    EquilibriumDetector equilibrium_;
    bool equilibrium_reached_ = false;
    EquilibriumPoint equilibrium_point_{};
    bool extinction_occurred_ = false;

    std::vector<TimeStepRecord> records_;
    RunSignatures signatures_{};
};

} // namespace ecodyn
