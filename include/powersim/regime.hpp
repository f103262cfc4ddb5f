#pragma once
#include <cstdint>
#include <random>
#include "powersim/types.hpp"

namespace powersim {

using RandomSource = std::mt19937_64;

// Static per-regime multipliers applied to SimulationParameters.
struct RegimeConfig {
    double volatility_multiplier;
    double jump_probability_multiplier;
};

// LOW 0.5/1.0, MEDIUM 1.0/1.5, HIGH 1.5/2.0
const RegimeConfig& regime_config(VolatilityRegime regime);

// "LOW", "MEDIUM" or "HIGH".
const char* regime_name(VolatilityRegime regime);

struct RegimeState {
    VolatilityRegime current_regime     = VolatilityRegime::Medium;
    double           segment_start_time = 0.0;
    double           next_switch_time   = kRegimeSwitchSeconds;
};

// RegimeScheduler
//
// Owns the active volatility regime and its fixed switching schedule.
// Every switch is an independent uniform draw over the three regimes, so the
// same regime may be drawn twice in a row.
class RegimeScheduler {
public:
    explicit RegimeScheduler(double switch_interval = kRegimeSwitchSeconds);

    // Draw the initial regime, valid for [0, switch_interval).
    // The random source must outlive the scheduler.
    void initialize(RandomSource& rng);

    // Redraw the regime if elapsed has reached the next switch boundary.
    // Returns true if at least one boundary was crossed.
    bool advance(double elapsed);

    VolatilityRegime current_regime() const { return state_.current_regime; }
    double segment_start_time() const { return state_.segment_start_time; }
    double next_switch_time() const { return state_.next_switch_time; }
    double switch_interval() const { return interval_; }
    RegimeState state() const { return state_; }

private:
    VolatilityRegime draw();

    double interval_;
    RegimeState state_;
    RandomSource* rng_;
    std::uniform_int_distribution<int> pick_;
};

} // namespace powersim
