#pragma once

#include <array>

#include "Ecosystem.h"

namespace ecodyn {

// Trailing window over recorded samples (not integration steps).
// Fixed capacity, no allocation while stepping.
class EquilibriumDetector {
public:
    struct WindowStats {
        double prey_mean = 0.0;
        double predator_mean = 0.0;
        double prey_stddev = 0.0;      // population standard deviation
        double predator_stddev = 0.0;
    };

    EquilibriumDetector() = default;

    void reset();
    void addSample(double prey, double predator);

    bool windowFull() const noexcept { return count_ == kEquilibriumWindow; }
    int sampleCount() const noexcept { return count_; }

    // Stats over the window, oldest sample first. False until the window is full.
    bool windowStats(WindowStats* out) const;

    // Both coefficients of variation below kEquilibriumTolerance.
    // A zero mean is never stable.
    bool isStable(WindowStats* out) const;

private:
    std::array<double, kEquilibriumWindow> prey_{};
    std::array<double, kEquilibriumWindow> predator_{};
    int head_ = 0;   // next write
    int count_ = 0;  // number valid
};

// Either population below kExtinctionThreshold. Checked after every micro-step.
bool isExtinct(const SimulationState& s);

} // namespace ecodyn
