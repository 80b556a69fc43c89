#include "Monitors.h"

#include <cmath>

namespace ecodyn {

void EquilibriumDetector::reset() {
    prey_.fill(0.0);
    predator_.fill(0.0);
    head_ = 0;
    count_ = 0;
}

void EquilibriumDetector::addSample(double prey, double predator) {
    prey_[head_] = prey;
    predator_[head_] = predator;
    head_ = (head_ + 1) % kEquilibriumWindow;
    if (count_ < kEquilibriumWindow) count_++;
}

bool EquilibriumDetector::windowStats(WindowStats* out) const {
    if (!out || !windowFull()) return false;

    // Oldest entry sits at head_ once the ring has wrapped.
    double prey_sum = 0.0;
    double predator_sum = 0.0;
    for (int k = 0; k < kEquilibriumWindow; ++k) {
        const int i = (head_ + k) % kEquilibriumWindow;
        prey_sum += prey_[i];
        predator_sum += predator_[i];
    }
    const double n = static_cast<double>(kEquilibriumWindow);
    const double prey_mean = prey_sum / n;
    const double predator_mean = predator_sum / n;

    double prey_var = 0.0;
    double predator_var = 0.0;
    for (int k = 0; k < kEquilibriumWindow; ++k) {
        const int i = (head_ + k) % kEquilibriumWindow;
        const double dp = prey_[i] - prey_mean;
        const double dq = predator_[i] - predator_mean;
        prey_var += dp * dp;
        predator_var += dq * dq;
    }

    out->prey_mean = prey_mean;
    out->predator_mean = predator_mean;
    out->prey_stddev = std::sqrt(prey_var / n);
    out->predator_stddev = std::sqrt(predator_var / n);
    return true;
}

bool EquilibriumDetector::isStable(WindowStats* out) const {
    WindowStats st;
    if (!windowStats(&st)) return false;
    if (out) *out = st;

    if (!(st.prey_mean > 0.0) || !(st.predator_mean > 0.0)) return false;
    const bool prey_stable = (st.prey_stddev / st.prey_mean) < kEquilibriumTolerance;
    const bool predator_stable = (st.predator_stddev / st.predator_mean) < kEquilibriumTolerance;
    return prey_stable && predator_stable;
}

bool isExtinct(const SimulationState& s) {
    return s.prey < kExtinctionThreshold || s.predator < kExtinctionThreshold;
}

} // namespace ecodyn
