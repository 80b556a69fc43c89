#include "ParameterFile.h"
#include "Presets.h"
#include "Simulation.h"
#include "StaticAnalysis.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void printUsage() {
    std::cout << "RunTool usage:\n"
              << "  RunTool [--preset name | --params file] [--horizon t]\n"
              << "          [--stream [--batch k]] [--csv file]\n"
              << "          [--predict] [--phase-space n] [--dump-params] [--list-presets]\n";
}

void printPresets() {
    for (const auto& p : ecodyn::builtinPresets()) {
        std::cout << std::left << std::setw(20) << p.key << p.name << " - " << p.description << "\n";
    }
}

bool writeTrajectoryCSV(const std::string& filename, const ecodyn::SimulationResult& r) {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }
    out << "time,prey,predator,resource\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& rec : r.time_steps) {
        out << rec.time << ',' << rec.prey_population << ','
            << rec.predator_population << ',' << rec.resource_level << '\n';
    }
    return static_cast<bool>(out);
}

void printSummary(const ecodyn::SimulationResult& r, const ecodyn::RunSignatures& sig) {
    const auto& s = r.summary;
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "Records:      " << r.time_steps.size() << "\n";
    std::cout << "Duration:     " << s.duration << "\n";
    std::cout << "Prey:         final " << s.final_prey << "  min " << s.min_prey << "  max " << s.max_prey << "\n";
    std::cout << "Predator:     final " << s.final_predator << "  min " << s.min_predator << "  max " << s.max_predator << "\n";
    std::cout << "Avg resource: " << s.average_resource_level << "\n";
    std::cout << "Extinction:   " << (r.extinction_occurred ? "YES" : "NO") << "\n";
    std::cout << "Equilibrium:  " << (r.equilibrium_reached ? "YES" : "NO");
    if (r.equilibrium_reached) {
        std::cout << "  prey " << r.equilibrium_point.prey_mean
                  << "  predator " << r.equilibrium_point.predator_mean
                  << "  at t=" << r.equilibrium_point.time_reached;
    }
    std::cout << "\n";
    std::cout << std::hex << std::setfill('0')
              << "Signatures:   params 0x" << std::setw(8) << sig.param_hash_u32
              << "  trajectory 0x" << std::setw(8) << sig.trajectory_crc_u32
              << std::dec << std::setfill(' ') << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string preset_name = "balanced";
    std::string params_path;
    std::string csv_path;
    double horizon = 0.0; // 0: not given
    bool stream = false;
    int batch = ecodyn::kDefaultBatchSteps;
    bool predict = false;
    int phase_resolution = 0;
    bool dump_params = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        try {
            if (arg == "--preset" && i + 1 < argc) {
                preset_name = argv[++i];
            } else if (arg == "--params" && i + 1 < argc) {
                params_path = argv[++i];
            } else if (arg == "--horizon" && i + 1 < argc) {
                horizon = std::stod(argv[++i]);
                if (!std::isfinite(horizon) || horizon <= 0.0) {
                    std::cerr << "Bad value for " << arg << "\n";
                    return 1;
                }
            } else if (arg == "--stream") {
                stream = true;
            } else if (arg == "--batch" && i + 1 < argc) {
                batch = std::stoi(argv[++i]);
            } else if (arg == "--csv" && i + 1 < argc) {
                csv_path = argv[++i];
            } else if (arg == "--predict") {
                predict = true;
            } else if (arg == "--phase-space" && i + 1 < argc) {
                phase_resolution = std::stoi(argv[++i]);
            } else if (arg == "--dump-params") {
                dump_params = true;
            } else if (arg == "--list-presets") {
                printPresets();
                return 0;
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

    ecodyn::SimulationParameters params;
    double run_horizon = ecodyn::kDefaultHorizon;
    if (!params_path.empty()) {
        ecodyn::ParameterFile file;
        std::string error;
        if (ecodyn::loadParameterFile(params_path, &file, &error) != ecodyn::EngineStatus::Ok) {
            std::cerr << "Cannot use parameter file: " << error << "\n";
            return 1;
        }
        params = file.parameters;
        run_horizon = file.horizon;
    } else {
        ecodyn::Preset preset;
        if (!ecodyn::findPreset(preset_name, &preset)) {
            std::cerr << "Unknown preset: " << preset_name << "\n";
            return 1;
        }
        params = preset.parameters;
        std::cout << "Preset: " << preset.name << "\n";
    }
    if (horizon > 0.0) {
        run_horizon = horizon;
    }

    if (dump_params) {
        std::cout << ecodyn::formatParameterText(params, run_horizon);
        return 0;
    }

    if (predict) {
        ecodyn::EquilibriumPrediction pred;
        const ecodyn::EngineStatus st = ecodyn::predictEquilibrium(params, &pred);
        if (st != ecodyn::EngineStatus::Ok) {
            std::cerr << "Prediction failed: " << ecodyn::statusName(st) << "\n";
            return 1;
        }
        // Host-side confidence policy; the engine only reports the estimate.
        const double confidence = pred.is_stable ? 0.8 : 0.3;
        std::cout << std::fixed << std::setprecision(3)
                  << "Predicted equilibrium (heuristic): prey " << pred.prey
                  << "  predator " << pred.predator
                  << "  stable " << (pred.is_stable ? "YES" : "NO")
                  << "  confidence " << confidence << "\n";
        return 0;
    }

    if (phase_resolution > 0) {
        std::vector<ecodyn::PhaseSpaceSample> grid;
        const ecodyn::EngineStatus st = ecodyn::samplePhaseSpace(params, phase_resolution, &grid);
        if (st != ecodyn::EngineStatus::Ok) {
            std::cerr << "Phase-space sampling failed: " << ecodyn::statusName(st) << "\n";
            return 1;
        }
        std::cout << "# resolution " << phase_resolution
                  << " prey_max " << params.prey.carrying_capacity
                  << " predator_max " << params.predator.initial_population * 10.0 << "\n";
        std::cout << "x,y,dx,dy\n" << std::setprecision(6);
        for (const auto& s : grid) {
            std::cout << s.x << ',' << s.y << ',' << s.dx << ',' << s.dy << '\n';
        }
        return 0;
    }

    ecodyn::Simulation sim;
    ecodyn::EngineStatus st = sim.reset(params, run_horizon);
    if (st != ecodyn::EngineStatus::Ok) {
        std::cerr << "Invalid parameter set: " << ecodyn::statusName(st) << "\n";
        return 1;
    }

    ecodyn::SimulationResult result;
    if (stream) {
        int frame = 0;
        while (!sim.isConcluded()) {
            ecodyn::SimulationState state;
            st = sim.advanceBatch(batch, &state);
            if (st != ecodyn::EngineStatus::Ok) {
                break;
            }
            const ecodyn::Observation o = sim.observe();
            std::cout << "update " << frame++ << std::fixed << std::setprecision(2)
                      << " t=" << o.time
                      << " prey=" << std::setprecision(1) << o.prey
                      << " predator=" << o.predator
                      << " resource=" << std::setprecision(3) << o.resource_level << "\n";
        }
        if (st == ecodyn::EngineStatus::Ok) {
            st = sim.finish(&result);
        }
    } else {
        st = sim.runToCompletion(&result);
    }

    if (st != ecodyn::EngineStatus::Ok) {
        std::cerr << "Simulation failed: " << ecodyn::statusName(st) << "\n";
        return 1;
    }

    printSummary(result, sim.getRunSignatures());

    if (!csv_path.empty()) {
        if (!writeTrajectoryCSV(csv_path, result)) {
            std::cerr << "Could not write " << csv_path << "\n";
            return 1;
        }
        std::cout << "Trajectory exported to: " << csv_path << "\n";
    }
    return 0;
}
