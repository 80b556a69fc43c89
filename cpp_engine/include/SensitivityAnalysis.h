#pragma once

#include <functional>
#include <string>
#include <vector>

#include "Ecosystem.h"

namespace ecodyn {

class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        SimulationParameters parameters{};
        double horizon = kDefaultHorizon;
    };

    struct SampleResult {
        EngineStatus status = EngineStatus::Ok;
        double final_prey = 0.0;
        double final_predator = 0.0;
        double min_prey = 0.0;
        double min_predator = 0.0;
        double max_prey = 0.0;
        double max_predator = 0.0;
        double duration = 0.0;
        bool equilibrium_reached = false;
        bool extinction_occurred = false;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    void clearResults();

    void analyzeBirthRate(const ParameterRange& range);
    void analyzeCarryingCapacity(const ParameterRange& range);
    void analyzeHuntingEfficiency(const ParameterRange& range);
    void analyzeDeathRate(const ParameterRange& range);
    void analyzeResourceAvailability(const ParameterRange& range);

    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

private:
    using Setter = std::function<void(SimulationParameters&, double)>;

    ScenarioConfig scenario_{};
    std::vector<SensitivityRow> results_{};

    void sweep(const char* name, const ParameterRange& range, const Setter& apply);
    SampleResult runScenario(const ScenarioConfig& scenario) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace ecodyn
