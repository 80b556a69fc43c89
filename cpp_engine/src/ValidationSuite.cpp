#include "Presets.h"
#include "Simulation.h"
#include "StaticAnalysis.h"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

// Analytic estimate vs. simulated outcome for one parameter set.
struct Comparison {
    std::string name;
    ecodyn::EquilibriumPrediction predicted{};
    ecodyn::SimulationResult simulated{};
    double prey_err = 0.0;
    double predator_err = 0.0;
    bool prey_comparable = false;      // false when the simulated value is zero
    bool predator_comparable = false;
    bool agrees = false;
};

// The predictor drops the logistic term, so agreement is only expected
// within a loose band and only for runs that actually settle.
constexpr double kAgreementTolerance = 0.10;

// Relative error is undefined against a zero target; the row reports n/a.
static bool relError(double predicted, double target, double* out) {
    if (target == 0.0) return false;
    *out = std::fabs(predicted - target) / std::fabs(target);
    return true;
}

static std::string percentText(bool comparable, double err) {
    if (!comparable) return "n/a";
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << (err * 100.0) << "%";
    return os.str();
}

static std::string yesno(bool v) { return v ? "YES" : "NO"; }

static bool compare(const std::string& name, const ecodyn::SimulationParameters& p, Comparison* out) {
    out->name = name;
    ecodyn::EngineStatus st = ecodyn::predictEquilibrium(p, &out->predicted);
    if (st != ecodyn::EngineStatus::Ok) {
        std::cerr << name << ": prediction failed (" << ecodyn::statusName(st) << ")\n";
        return false;
    }

    ecodyn::Simulation sim;
    st = sim.reset(p);
    if (st == ecodyn::EngineStatus::Ok) {
        st = sim.runToCompletion(&out->simulated);
    }
    if (st != ecodyn::EngineStatus::Ok) {
        std::cerr << name << ": simulation failed (" << ecodyn::statusName(st) << ")\n";
        return false;
    }

    const auto& r = out->simulated;
    const double prey_ref = r.equilibrium_reached ? r.equilibrium_point.prey_mean : r.summary.final_prey;
    const double predator_ref = r.equilibrium_reached ? r.equilibrium_point.predator_mean : r.summary.final_predator;
    out->prey_comparable = relError(out->predicted.prey, prey_ref, &out->prey_err);
    out->predator_comparable = relError(out->predicted.predator, predator_ref, &out->predator_err);
    out->agrees = r.equilibrium_reached &&
                  out->prey_comparable && out->predator_comparable &&
                  out->prey_err <= kAgreementTolerance &&
                  out->predator_err <= kAgreementTolerance;
    return true;
}

static ecodyn::SimulationParameters fixedPointStart() {
    // Balanced rates started on their interior fixed point.
    ecodyn::SimulationParameters p;
    p.prey = {100.0, 1.0, 5000.0};
    p.predator = {68.0, 0.01, 0.5};
    p.environment = {0.7, false, 0.0};
    return p;
}

static ecodyn::SimulationParameters overshootCollapse() {
    // Prey far above K: the first step clamps prey to exactly zero.
    ecodyn::SimulationParameters p;
    p.prey = {5000.0, 5.0, 100.0};
    p.predator = {100.0, 0.01, 0.5};
    p.environment = {1.0, false, 0.0};
    return p;
}

static ecodyn::SimulationParameters dampedOscillator() {
    ecodyn::SimulationParameters p;
    p.prey = {400.0, 2.0, 500.0};
    p.predator = {20.0, 0.01, 1.5};
    p.environment = {1.0, false, 0.0};
    return p;
}

} // namespace

int main() {
    std::cout << "=== ECODYN EQUILIBRIUM VALIDATION SUITE ===\n";
    std::cout << "Analytic isocline estimate vs. RK4 trajectories\n\n";

    std::vector<std::pair<std::string, ecodyn::SimulationParameters>> cases;
    for (const auto& preset : ecodyn::builtinPresets()) {
        cases.emplace_back(preset.name, preset.parameters);
    }
    cases.emplace_back("Fixed-Point Start", fixedPointStart());
    cases.emplace_back("Damped Oscillator", dampedOscillator());
    cases.emplace_back("Overshoot Collapse", overshootCollapse());

    std::vector<Comparison> rows;
    for (const auto& c : cases) {
        Comparison cmp;
        if (!compare(c.first, c.second, &cmp)) {
            return 1;
        }
        const auto& r = cmp.simulated;
        std::cout << "=== " << cmp.name << " ===\n";
        std::cout << "Predicted (heuristic): prey " << std::fixed << std::setprecision(3) << cmp.predicted.prey
                  << ", predator " << cmp.predicted.predator
                  << ", stable " << yesno(cmp.predicted.is_stable) << "\n";
        std::cout << "Simulated: duration " << std::setprecision(2) << r.summary.duration
                  << ", extinction " << yesno(r.extinction_occurred)
                  << ", equilibrium " << yesno(r.equilibrium_reached);
        if (r.equilibrium_reached) {
            std::cout << " (prey " << std::setprecision(3) << r.equilibrium_point.prey_mean
                      << ", predator " << r.equilibrium_point.predator_mean
                      << ", t=" << std::setprecision(2) << r.equilibrium_point.time_reached << ")";
        }
        std::cout << "\n";
        std::cout << "Relative Error: prey " << percentText(cmp.prey_comparable, cmp.prey_err)
                  << ", predator " << percentText(cmp.predator_comparable, cmp.predator_err) << "\n";
        std::cout << "Within Tolerance: " << yesno(cmp.agrees) << "\n\n";
        rows.push_back(cmp);
    }

    // Summary table
    int agree = 0;
    std::cout << "Scenario                 | Prey err | Pred err | Outcome     | Agrees\n";
    std::cout << "-----------------------------------------------------------------------\n";
    for (const auto& cmp : rows) {
        const auto& r = cmp.simulated;
        const std::string outcome = r.extinction_occurred ? "extinction"
                                  : (r.equilibrium_reached ? "equilibrium" : "horizon");
        if (cmp.agrees) ++agree;
        std::cout << std::left << std::setw(24) << cmp.name << " | "
                  << std::right << std::setw(8) << percentText(cmp.prey_comparable, cmp.prey_err) << " | "
                  << std::setw(8) << percentText(cmp.predator_comparable, cmp.predator_err) << " | "
                  << std::left << std::setw(11) << outcome << " | "
                  << yesno(cmp.agrees) << "\n";
    }
    std::cout << std::right;
    std::cout << "\nTOTAL: " << agree << "/" << rows.size()
              << " scenarios settle within " << (kAgreementTolerance * 100.0) << "% of the estimate\n\n";

    const std::string csv_name = "validation_results.csv";
    std::ofstream csv(csv_name);
    if (csv) {
        csv << "Scenario,Predicted_Prey,Predicted_Predator,Simulated_Prey,Simulated_Predator,"
               "Prey_Error_%,Predator_Error_%,Equilibrium,Extinction,Duration,Agrees\n";
        for (const auto& cmp : rows) {
            const auto& r = cmp.simulated;
            const double prey_ref = r.equilibrium_reached ? r.equilibrium_point.prey_mean : r.summary.final_prey;
            const double predator_ref = r.equilibrium_reached ? r.equilibrium_point.predator_mean : r.summary.final_predator;
            csv << cmp.name << ',' << cmp.predicted.prey << ',' << cmp.predicted.predator << ','
                << prey_ref << ',' << predator_ref << ','
                << (cmp.prey_comparable ? std::to_string(cmp.prey_err * 100.0) : std::string("n/a")) << ','
                << (cmp.predator_comparable ? std::to_string(cmp.predator_err * 100.0) : std::string("n/a")) << ','
                << yesno(r.equilibrium_reached) << ',' << yesno(r.extinction_occurred) << ','
                << r.summary.duration << ',' << yesno(cmp.agrees) << "\n";
        }
        csv.close();
        std::cout << "Results exported to: " << csv_name << "\n";
    } else {
        std::cerr << "Could not write " << csv_name << "\n";
    }

    return 0;
}
