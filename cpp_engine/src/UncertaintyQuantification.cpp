#include "UncertaintyQuantification.h"

#include "Simulation.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace ecodyn {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void MonteCarloUQ::setRanges(const UQRanges& ranges) {
    ranges_ = ranges;
}

MonteCarloUQ::SampleMetrics MonteCarloUQ::runScenario(const ScenarioConfig& scenario) const {
    SampleMetrics m{};

    Simulation sim;
    m.status = sim.reset(scenario.parameters, scenario.horizon);
    if (m.status != EngineStatus::Ok) return m;

    SimulationResult result;
    m.status = sim.runToCompletion(&result);
    if (m.status != EngineStatus::Ok) return m;

    m.final_prey = result.summary.final_prey;
    m.final_predator = result.summary.final_predator;
    m.duration = result.summary.duration;
    m.extinction = result.extinction_occurred;
    m.equilibrium = result.equilibrium_reached;
    return m;
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) const {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const ScenarioConfig& scenario, int num_samples) const {
    const int samples = clampSamples(num_samples);
    std::mt19937 rng(1337u);

    auto birth_samples = latinHypercubeSamples(ranges_.birth_rate.min,
                                               ranges_.birth_rate.max,
                                               samples,
                                               rng);
    auto hunt_samples = latinHypercubeSamples(ranges_.hunting_efficiency.min,
                                              ranges_.hunting_efficiency.max,
                                              samples,
                                              rng);
    auto death_samples = latinHypercubeSamples(ranges_.death_rate.min,
                                               ranges_.death_rate.max,
                                               samples,
                                               rng);
    auto resource_samples = latinHypercubeSamples(ranges_.resource_availability.min,
                                                  ranges_.resource_availability.max,
                                                  samples,
                                                  rng);

    std::vector<double> final_prey;
    std::vector<double> final_predator;
    std::vector<double> duration;
    final_prey.reserve(static_cast<std::size_t>(samples));
    final_predator.reserve(static_cast<std::size_t>(samples));
    duration.reserve(static_cast<std::size_t>(samples));

    UQSummary summary{};
    int extinctions = 0;
    int equilibria = 0;

    for (int i = 0; i < samples; ++i) {
        ScenarioConfig varied = scenario;
        varied.parameters.prey.birth_rate = birth_samples[i];
        varied.parameters.predator.hunting_efficiency = hunt_samples[i];
        varied.parameters.predator.death_rate = death_samples[i];
        varied.parameters.environment.resource_availability = resource_samples[i];

        const auto metrics = runScenario(varied);
        if (metrics.status != EngineStatus::Ok) {
            summary.failed_runs++;
            continue;
        }
        final_prey.push_back(metrics.final_prey);
        final_predator.push_back(metrics.final_predator);
        duration.push_back(metrics.duration);
        if (metrics.extinction) extinctions++;
        if (metrics.equilibrium) equilibria++;
    }

    summary.completed_runs = static_cast<int>(duration.size());
    summary.final_prey = summarize(final_prey);
    summary.final_predator = summarize(final_predator);
    summary.duration = summarize(duration);
    if (summary.completed_runs > 0) {
        summary.extinction_fraction = static_cast<double>(extinctions) / summary.completed_runs;
        summary.equilibrium_fraction = static_cast<double>(equilibria) / summary.completed_runs;
    }
    return summary;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(scenario_, num_samples);
}

} // namespace ecodyn
