#include "SensitivityAnalysis.h"

#include "Simulation.h"

#include <fstream>
#include <iomanip>

namespace ecodyn {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runScenario(const ScenarioConfig& scenario) const {
    SampleResult m{};

    Simulation sim;
    m.status = sim.reset(scenario.parameters, scenario.horizon);
    if (m.status != EngineStatus::Ok) return m;

    SimulationResult result;
    m.status = sim.runToCompletion(&result);
    if (m.status != EngineStatus::Ok) return m;

    m.final_prey = result.summary.final_prey;
    m.final_predator = result.summary.final_predator;
    m.min_prey = result.summary.min_prey;
    m.min_predator = result.summary.min_predator;
    m.max_prey = result.summary.max_prey;
    m.max_predator = result.summary.max_predator;
    m.duration = result.summary.duration;
    m.equilibrium_reached = result.equilibrium_reached;
    m.extinction_occurred = result.extinction_occurred;
    return m;
}

void SensitivityAnalyzer::sweep(const char* name, const ParameterRange& range, const Setter& apply) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScenarioConfig scenario = scenario_;
        apply(scenario.parameters, value);
        const auto metrics = runScenario(scenario);
        results_.push_back({name, value, metrics});
    }
}

void SensitivityAnalyzer::analyzeBirthRate(const ParameterRange& range) {
    sweep("prey.birth_rate", range, [](SimulationParameters& p, double v) {
        p.prey.birth_rate = v;
    });
}

void SensitivityAnalyzer::analyzeCarryingCapacity(const ParameterRange& range) {
    sweep("prey.carrying_capacity", range, [](SimulationParameters& p, double v) {
        p.prey.carrying_capacity = v;
    });
}

void SensitivityAnalyzer::analyzeHuntingEfficiency(const ParameterRange& range) {
    sweep("predator.hunting_efficiency", range, [](SimulationParameters& p, double v) {
        p.predator.hunting_efficiency = v;
    });
}

void SensitivityAnalyzer::analyzeDeathRate(const ParameterRange& range) {
    sweep("predator.death_rate", range, [](SimulationParameters& p, double v) {
        p.predator.death_rate = v;
    });
}

void SensitivityAnalyzer::analyzeResourceAvailability(const ParameterRange& range) {
    sweep("environment.resource_availability", range, [](SimulationParameters& p, double v) {
        p.environment.resource_availability = v;
    });
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,status,final_prey,final_predator,min_prey,min_predator,"
           "max_prey,max_predator,duration,equilibrium,extinction\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << statusName(row.metrics.status) << ','
            << row.metrics.final_prey << ','
            << row.metrics.final_predator << ','
            << row.metrics.min_prey << ','
            << row.metrics.min_predator << ','
            << row.metrics.max_prey << ','
            << row.metrics.max_predator << ','
            << row.metrics.duration << ','
            << (row.metrics.equilibrium_reached ? 1 : 0) << ','
            << (row.metrics.extinction_occurred ? 1 : 0) << '\n';
    }
    return static_cast<bool>(out);
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace ecodyn
