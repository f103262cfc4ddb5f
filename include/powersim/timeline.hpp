#pragma once
#include <cstddef>
#include <cstdint>
#include "powersim/regime.hpp"
#include "powersim/types.hpp"

namespace powersim {

// TimelineOptions: simulation clock and starting point of a run.
// Defaults give the standard 900-tick, 180s run with 6 regime segments.
struct TimelineOptions {
    double dt              = kTickSeconds;
    double duration        = kRunSeconds;
    double regime_interval = kRegimeSwitchSeconds;
    double initial_price   = kLongTermMean;
};

// TimelineGenerator
//
// Runs RegimeScheduler and the price engine across every tick and returns the
// whole trajectory in one synchronous pass. Nothing is exposed before the last
// tick is computed, so pacing never depends on generation cost.
class TimelineGenerator {
public:
    explicit TimelineGenerator(const TimelineOptions& opts = TimelineOptions{});

    // Generate a full timeline. seed == 0 draws a fresh time-based seed; the
    // seed used is stored in the returned timeline.
    SimulationTimeline generate(const SimulationParameters& params, uint64_t seed = 0) const;

    // Number of ticks per run: round(duration / dt).
    std::size_t tick_count() const;

    const TimelineOptions& options() const { return opts_; }

private:
    TimelineOptions opts_;
};

} // namespace powersim
