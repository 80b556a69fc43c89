#include "Simulation.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <cstring>

namespace ecodyn {

namespace {

static inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

static inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

static inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
static inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}

static const std::array<std::uint32_t, 256>& crc32Table() {
    static const std::array<std::uint32_t, 256> table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

static inline std::uint32_t crc32_update(std::uint32_t crc, const void* data, std::size_t len) {
    const auto& table = crc32Table();
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    std::uint32_t c = crc ^ 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        c = table[(c ^ p[i]) & 0xFFu] ^ (c >> 8);
    }
    return c ^ 0xFFFFFFFFu;
}

static inline std::uint32_t crc32_add_f64(std::uint32_t crc, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return crc32_update(crc, &bits, sizeof(bits));
}

static inline double finiteOr(double x, double fallback) {
    return std::isfinite(x) ? x : fallback;
}

} // namespace

std::uint32_t parameterHash(const SimulationParameters& p) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_f64(h, p.prey.initial_population);
    h = fnv1a32_add_f64(h, p.prey.birth_rate);
    h = fnv1a32_add_f64(h, p.prey.carrying_capacity);
    h = fnv1a32_add_f64(h, p.predator.initial_population);
    h = fnv1a32_add_f64(h, p.predator.hunting_efficiency);
    h = fnv1a32_add_f64(h, p.predator.death_rate);
    h = fnv1a32_add_f64(h, p.environment.resource_availability);
    h = fnv1a32_add_u32(h, p.environment.seasonal_variation ? 1u : 0u);
    h = fnv1a32_add_f64(h, p.environment.seasonal_amplitude);
    return h;
}

Simulation::Simulation() = default;

EngineStatus Simulation::reset(const SimulationParameters& p) {
    return reset(p, kDefaultHorizon);
}

EngineStatus Simulation::reset(const SimulationParameters& p, double horizon) {
    // Rejected input leaves the current run (or lack of one) untouched.
    const EngineStatus st = validateParameters(p);
    if (st != EngineStatus::Ok) return st;
    if (!std::isfinite(horizon) || horizon <= 0.0) return EngineStatus::InvalidParameters;

    params_ = p;
    state_ = SimulationState{};
    state_.prey = p.prey.initial_population;
    state_.predator = p.predator.initial_population;

    finished_ = false;
    degenerate_ = false;
    horizon_ = horizon;
    last_record_time_ = 0.0;
    micro_steps_ = 0;

    equilibrium_.reset();
    equilibrium_reached_ = false;
    equilibrium_point_ = EquilibriumPoint{};
    extinction_occurred_ = false;

    records_.clear();
    signatures_ = RunSignatures{};
    signatures_.param_hash_u32 = parameterHash(p);

    configured_ = true;
    return EngineStatus::Ok;
}

bool Simulation::isConcluded() const noexcept {
    if (!configured_) return false;
    return finished_ || degenerate_ || extinction_occurred_ || !(state_.time < horizon_);
}

void Simulation::appendRecord() {
    const TimeStepRecord rec = makeRecord(state_, params_.environment);
    records_.push_back(rec);
    equilibrium_.addSample(rec.prey_population, rec.predator_population);

    std::uint32_t crc = signatures_.trajectory_crc_u32;
    crc = crc32_add_f64(crc, rec.time);
    crc = crc32_add_f64(crc, rec.prey_population);
    crc = crc32_add_f64(crc, rec.predator_population);
    crc = crc32_add_f64(crc, rec.resource_level);
    signatures_.trajectory_crc_u32 = crc;
    signatures_.record_count_u32 = static_cast<std::uint32_t>(records_.size());
}

EngineStatus Simulation::microStep() {
    if (state_.time - last_record_time_ >= kRecordInterval) {
        appendRecord();
        last_record_time_ = state_.time;
    }

    const SimulationState next = integrateStep(state_, params_, kFixedDt);
    if (!std::isfinite(next.prey) || !std::isfinite(next.predator)) {
        // Keep the last finite state; nothing non-finite is ever recorded.
        degenerate_ = true;
        return EngineStatus::NumericDegeneracy;
    }
    state_.prey = next.prey;
    state_.predator = next.predator;
    ++micro_steps_;

    if (isExtinct(state_)) {
        extinction_occurred_ = true;
        return EngineStatus::Ok;
    }

    if (!equilibrium_reached_) {
        EquilibriumDetector::WindowStats st;
        if (equilibrium_.isStable(&st)) {
            equilibrium_reached_ = true;
            equilibrium_point_.prey_mean = st.prey_mean;
            equilibrium_point_.predator_mean = st.predator_mean;
            equilibrium_point_.time_reached = state_.time;

            const double extra = std::min(kPostEquilibriumGrace, horizon_ - state_.time);
            horizon_ = state_.time + extra;
        }
    }

    state_.time = next.time;
    return EngineStatus::Ok;
}

EngineStatus Simulation::advanceBatch(int steps, SimulationState* out) {
    if (!configured_) return EngineStatus::NotConfigured;
    if (steps <= 0) return EngineStatus::InvalidParameters;

    for (int i = 0; i < steps && !isConcluded(); ++i) {
        const EngineStatus st = microStep();
        if (st != EngineStatus::Ok) break;
    }

    if (out) *out = state_;
    return degenerate_ ? EngineStatus::NumericDegeneracy : EngineStatus::Ok;
}

EngineStatus Simulation::runToCompletion(SimulationResult* out) {
    if (!configured_) return EngineStatus::NotConfigured;

    while (!isConcluded()) {
        const EngineStatus st = microStep();
        if (st != EngineStatus::Ok) return st;
    }
    return finish(out);
}

EngineStatus Simulation::finish(SimulationResult* out) {
    if (!configured_) return EngineStatus::NotConfigured;
    if (degenerate_) return EngineStatus::NumericDegeneracy;

    if (!finished_) {
        // Final state is always represented, even off-cadence.
        appendRecord();
        finished_ = true;
    }
    if (out) buildResult(out);
    return EngineStatus::Ok;
}

void Simulation::buildResult(SimulationResult* out) const {
    out->time_steps = records_;
    out->equilibrium_reached = equilibrium_reached_;
    out->equilibrium_point = equilibrium_point_;
    out->extinction_occurred = extinction_occurred_;

    SimulationSummary s{};
    s.duration = state_.time;
    s.final_prey = state_.prey;
    s.final_predator = state_.predator;
    if (!records_.empty()) {
        s.max_prey = s.min_prey = records_.front().prey_population;
        s.max_predator = s.min_predator = records_.front().predator_population;
        double resource_sum = 0.0;
        for (const auto& r : records_) {
            s.max_prey = std::max(s.max_prey, r.prey_population);
            s.min_prey = std::min(s.min_prey, r.prey_population);
            s.max_predator = std::max(s.max_predator, r.predator_population);
            s.min_predator = std::min(s.min_predator, r.predator_population);
            resource_sum += r.resource_level;
        }
        s.average_resource_level = resource_sum / static_cast<double>(records_.size());
    }
    out->summary = s;
}

Observation Simulation::observe() const {
    Observation o;
    if (!configured_) return o;

    o.time = finiteOr(state_.time, 0.0);
    o.prey = finiteOr(state_.prey, 0.0);
    o.predator = finiteOr(state_.predator, 0.0);
    o.resource_level = finiteOr(resourceLevel(params_.environment, state_.time), 0.0);
    o.horizon = horizon_;
    o.micro_steps = micro_steps_;
    o.equilibrium_reached = equilibrium_reached_;
    o.extinction_occurred = extinction_occurred_;
    o.concluded = isConcluded();
    return o;
}

} // namespace ecodyn
