#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace powersim {

// Long-run mean and hard price bounds (EUR/MWh).
constexpr double kLongTermMean = 100.0;
constexpr double kPriceMin     = 10.0;
constexpr double kPriceMax     = 300.0;

// Default simulation clock: 900 ticks of 0.2s, regimes switch every 30s.
constexpr double kTickSeconds           = 0.2;
constexpr double kRunSeconds            = 180.0;
constexpr double kRegimeSwitchSeconds   = 30.0;

enum class VolatilityRegime : uint8_t { Low = 0, Medium = 1, High = 2 };

// SimulationParameters
//
// Vetted inputs for one run. Ranges are enforced upstream:
//   max_volatility          [0, 50]      EUR/MWh
//   mean_reversion_strength [0.01, 0.5]  per second
//   jump_frequency          [0, 5]       jumps per minute
struct SimulationParameters {
    double max_volatility          = 15.0;
    double mean_reversion_strength = 0.05;
    double jump_frequency          = 2.0;
};

struct PricePoint {
    double           timestamp;      // seconds since run start
    double           price;          // EUR/MWh, always in [kPriceMin, kPriceMax]
    VolatilityRegime regime;         // regime active when the point was produced
    bool             jump_occurred;
};

// One 30s regime segment of a timeline.
struct RegimeSegment {
    std::size_t      start_index;
    double           start_time;
    VolatilityRegime regime;
};

// SimulationTimeline
//
// Complete precomputed trajectory of a run. Built once by TimelineGenerator and
// only read afterwards (playback, snapshots).
struct SimulationTimeline {
    SimulationParameters       parameters;
    uint64_t                   seed = 0;       // seed actually used
    double                     dt   = kTickSeconds;
    std::vector<PricePoint>    points;
    std::vector<RegimeSegment> segments;

    std::size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
    const PricePoint& operator[](std::size_t i) const { return points[i]; }

    // Number of points flagged with a jump.
    std::size_t jump_count() const;
};

} // namespace powersim
