#pragma once

#include <vector>

#include "Ecosystem.h"

namespace ecodyn {

class MonteCarloUQ {
public:
    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct ScenarioConfig {
        SimulationParameters parameters{};
        double horizon = kDefaultHorizon;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        UQResult final_prey{};
        UQResult final_predator{};
        UQResult duration{};
        double extinction_fraction = 0.0;   // over completed runs
        double equilibrium_fraction = 0.0;  // over completed runs
        int completed_runs = 0;
        int failed_runs = 0;                // non-Ok status, excluded from the statistics
    };

    // Defaults bracket the built-in presets.
    struct UQRanges {
        ParameterRange birth_rate{0.5, 1.5};
        ParameterRange hunting_efficiency{0.005, 0.02};
        ParameterRange death_rate{0.3, 0.7};
        ParameterRange resource_availability{0.3, 0.9};
    };

    MonteCarloUQ();

    void setScenario(const ScenarioConfig& scenario);
    void setRanges(const UQRanges& ranges);

    UQSummary runMonteCarlo(const ScenarioConfig& scenario, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

private:
    struct SampleMetrics {
        EngineStatus status = EngineStatus::Ok;
        double final_prey = 0.0;
        double final_predator = 0.0;
        double duration = 0.0;
        bool extinction = false;
        bool equilibrium = false;
    };

    ScenarioConfig scenario_{};
    UQRanges ranges_{};

    SampleMetrics runScenario(const ScenarioConfig& scenario) const;
    UQResult summarize(const std::vector<double>& values) const;
};

} // namespace ecodyn
