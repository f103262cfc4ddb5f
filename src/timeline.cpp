#include "powersim/timeline.hpp"
#include "powersim/price_engine.hpp"
#include <cassert>
#include <chrono>
#include <cmath>

namespace powersim {

// Fallback seed source if caller does not provide a seed.
static uint64_t default_time_seed() {
    uint64_t s = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    return s == 0 ? 1 : s;
}

std::size_t SimulationTimeline::jump_count() const {
    std::size_t n = 0;
    for (const auto& p : points)
        if (p.jump_occurred) ++n;
    return n;
}

TimelineGenerator::TimelineGenerator(const TimelineOptions& opts)
    : opts_(opts)
{}

std::size_t TimelineGenerator::tick_count() const {
    return static_cast<std::size_t>(std::llround(opts_.duration / opts_.dt));
}

SimulationTimeline TimelineGenerator::generate(const SimulationParameters& params, uint64_t seed) const {
    SimulationTimeline tl;
    tl.parameters = params;
    tl.seed = (seed == 0) ? default_time_seed() : seed;
    tl.dt = opts_.dt;

    // One generator per run: never shared with another generation.
    RandomSource rng(tl.seed);
    RegimeScheduler scheduler(opts_.regime_interval);
    scheduler.initialize(rng);

    const std::size_t n = tick_count();
    tl.points.reserve(n);
    tl.segments.push_back(RegimeSegment{0, 0.0, scheduler.current_regime()});

    double price = opts_.initial_price;
    for (std::size_t i = 0; i < n; ++i) {
        double t = static_cast<double>(i) * opts_.dt;

        if (scheduler.advance(t)) {
            tl.segments.push_back(RegimeSegment{i, scheduler.segment_start_time(), scheduler.current_regime()});
        }

        PricePoint p = step(price, t, scheduler.current_regime(), params, opts_.dt, rng);
        assert(p.price >= kPriceMin && p.price <= kPriceMax && "price escaped [10, 300]");
        tl.points.push_back(p);
        price = p.price;
    }
    return tl;
}

} // namespace powersim
