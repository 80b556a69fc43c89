#include "ParameterFile.h"
#include "Presets.h"
#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <birth_rate|capacity|hunting|death_rate|resource>\n"
              << "            [--preset name | --params file] [--min v] [--max v] [--samples n] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    std::string preset_name = "balanced";
    std::string params_path;
    double min_val = 0.0;
    double max_val = 0.0;
    int samples = 5;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--preset" && i + 1 < argc) {
                preset_name = argv[++i];
            } else if (arg == "--params" && i + 1 < argc) {
                params_path = argv[++i];
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Bad value for " << arg << "\n";
            return 1;
        }
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    ecodyn::SensitivityAnalyzer::ScenarioConfig scenario;
    if (!params_path.empty()) {
        ecodyn::ParameterFile file;
        std::string error;
        if (ecodyn::loadParameterFile(params_path, &file, &error) != ecodyn::EngineStatus::Ok) {
            std::cerr << "Cannot use parameter file: " << error << "\n";
            return 1;
        }
        scenario.parameters = file.parameters;
        scenario.horizon = file.horizon;
    } else {
        ecodyn::Preset preset;
        if (!ecodyn::findPreset(preset_name, &preset)) {
            std::cerr << "Unknown preset: " << preset_name << "\n";
            return 1;
        }
        scenario.parameters = preset.parameters;
    }

    ecodyn::SensitivityAnalyzer analyzer;
    analyzer.setScenario(scenario);

    ecodyn::SensitivityAnalyzer::ParameterRange range;
    range.samples = samples;

    const ecodyn::SimulationParameters& p = scenario.parameters;
    if (param == "birth_rate" || param == "prey.birth_rate") {
        range.nominal = p.prey.birth_rate;
    } else if (param == "capacity" || param == "carrying_capacity" || param == "prey.carrying_capacity") {
        range.nominal = p.prey.carrying_capacity;
    } else if (param == "hunting" || param == "hunting_efficiency" || param == "predator.hunting_efficiency") {
        range.nominal = p.predator.hunting_efficiency;
    } else if (param == "death_rate" || param == "predator.death_rate") {
        range.nominal = p.predator.death_rate;
    } else if (param == "resource" || param == "resource_availability" || param == "environment.resource_availability") {
        range.nominal = p.environment.resource_availability;
    } else {
        std::cout << "Unsupported parameter: " << param << "\n";
        printUsage();
        return 1;
    }

    if (!min_set) {
        min_val = range.nominal * 0.75;
    }
    if (!max_set) {
        max_val = range.nominal * 1.25;
    }

    range.min = min_val;
    range.max = max_val;

    if (param == "birth_rate" || param == "prey.birth_rate") {
        analyzer.analyzeBirthRate(range);
    } else if (param == "capacity" || param == "carrying_capacity" || param == "prey.carrying_capacity") {
        analyzer.analyzeCarryingCapacity(range);
    } else if (param == "hunting" || param == "hunting_efficiency" || param == "predator.hunting_efficiency") {
        analyzer.analyzeHuntingEfficiency(range);
    } else if (param == "death_rate" || param == "predator.death_rate") {
        analyzer.analyzeDeathRate(range);
    } else {
        analyzer.analyzeResourceAvailability(range);
    }

    int failed = 0;
    for (const auto& row : analyzer.results()) {
        if (row.metrics.status != ecodyn::EngineStatus::Ok) {
            std::cerr << "  " << row.parameter_name << "=" << row.parameter_value
                      << " rejected: " << ecodyn::statusName(row.metrics.status) << "\n";
            ++failed;
        }
    }

    if (!analyzer.exportSensitivityMatrixCSV(out)) {
        std::cerr << "Could not write " << out << "\n";
        return 1;
    }
    std::cout << "Wrote sensitivity sweep to: " << out;
    if (failed > 0) {
        std::cout << " (" << failed << " sample(s) rejected)";
    }
    std::cout << "\n";
    return 0;
}
