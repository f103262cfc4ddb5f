#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include "powersim/playback.hpp"
#include "powersim/timeline.hpp"
#include "powersim/types.hpp"

namespace powersim {

// Configuration for a SimulationSession: generation clock plus pacing.
struct SessionConfig {
    TimelineOptions timeline;
    PlaybackConfig  playback;
    bool            log_events = true;
};

// Point-in-time view of a session for status displays.
struct SessionSnapshot {
    PlaybackState    state         = PlaybackState::Idle;
    double           current_price = kLongTermMean;
    double           elapsed       = 0.0;   // simulated seconds delivered
    VolatilityRegime regime        = VolatilityRegime::Medium;
    std::size_t      emitted       = 0;
    std::size_t      jumps         = 0;
    std::size_t      total         = 0;
};

// SimulationSession
//
// Explicit context of one run: locked parameters, the generated timeline and
// the playback controller pacing it. start() generates the complete timeline
// before any point is delivered. Parameters stay locked until the playback
// reaches a terminal state and reset() is called.
class SimulationSession {
public:
    // sink must outlive the session.
    explicit SimulationSession(PlaybackSink* sink, const SessionConfig& cfg = SessionConfig{});
    ~SimulationSession();

    SimulationSession(const SimulationSession&) = delete;
    SimulationSession& operator=(const SimulationSession&) = delete;

    // Generate a timeline for params and start playback. seed == 0 uses a fresh
    // time-based seed. Returns false while a run is RUNNING or PAUSED, or if
    // generation failed; no partial timeline is ever kept.
    bool start(const SimulationParameters& params, uint64_t seed = 0);
    bool pause();
    bool resume();
    // Cancel the current run (no-op if none is active).
    void stop();
    // Drop a finished run so new parameters can be started. Returns false
    // while a run is RUNNING or PAUSED.
    bool reset();
    // Block until the current run is terminal.
    void wait();

    SessionSnapshot snapshot() const;
    PlaybackState state() const;

    // Parameters of the loaded run, or of the last start() attempt.
    SimulationParameters parameters() const;
    // Null until start() succeeds, and after reset().
    std::shared_ptr<const SimulationTimeline> timeline() const;

private:
    PlaybackSink* sink_;
    SessionConfig cfg_;
    TimelineGenerator generator_;

    mutable std::mutex mtx_;
    SimulationParameters params_;
    std::shared_ptr<const SimulationTimeline> timeline_;
    std::shared_ptr<PlaybackController> player_;
};

} // namespace powersim
