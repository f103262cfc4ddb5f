#include "powersim/regime.hpp"
#include <cassert>

namespace powersim {

namespace {
    // Indexed by VolatilityRegime.
    const RegimeConfig kRegimeTable[3] = {
        {0.5, 1.0},  // LOW
        {1.0, 1.5},  // MEDIUM
        {1.5, 2.0},  // HIGH
    };

    // Absorbs accumulated error from i * dt style clocks (150 * 0.2 != 30.0 exactly).
    constexpr double kBoundaryEpsilon = 1e-9;
}

const RegimeConfig& regime_config(VolatilityRegime regime) {
    return kRegimeTable[static_cast<int>(regime)];
}

const char* regime_name(VolatilityRegime regime) {
    switch (regime) {
        case VolatilityRegime::Low:    return "LOW";
        case VolatilityRegime::Medium: return "MEDIUM";
        case VolatilityRegime::High:   return "HIGH";
    }
    return "UNKNOWN";
}

RegimeScheduler::RegimeScheduler(double switch_interval)
    : interval_(switch_interval),
      rng_(nullptr),
      pick_(0, 2)
{
    state_.next_switch_time = interval_;
}

VolatilityRegime RegimeScheduler::draw() {
    return static_cast<VolatilityRegime>(pick_(*rng_));
}

void RegimeScheduler::initialize(RandomSource& rng) {
    rng_ = &rng;
    pick_.reset();
    state_.current_regime     = draw();
    state_.segment_start_time = 0.0;
    state_.next_switch_time   = interval_;
}

bool RegimeScheduler::advance(double elapsed) {
    assert(rng_ != nullptr && "RegimeScheduler used before initialize()");
    bool switched = false;
    while (elapsed + kBoundaryEpsilon >= state_.next_switch_time) {
        state_.current_regime     = draw();
        state_.segment_start_time = state_.next_switch_time;
        state_.next_switch_time  += interval_;
        switched = true;
    }
    return switched;
}

} // namespace powersim
