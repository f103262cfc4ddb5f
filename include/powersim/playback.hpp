#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>
#include "powersim/types.hpp"

namespace powersim {

enum class PlaybackState : uint8_t {
    Idle      = 0,
    Running   = 1,
    Paused    = 2,
    Completed = 3,
    Cancelled = 4
};

const char* playback_state_name(PlaybackState s);

// Consumer of a paced timeline. All callbacks run on the playback thread,
// never concurrently with each other, and with no controller lock held.
class PlaybackSink {
public:
    virtual ~PlaybackSink() = default;

    // Once per point, strictly in timeline order.
    virtual void on_point(const PricePoint& p) = 0;
    // At the first point of each regime segment, before on_point.
    virtual void on_regime_change(VolatilityRegime regime, double timestamp) {}
    virtual void on_complete() {}
    virtual void on_cancelled() {}
    // Delivery has been more than overrun_threshold_s behind schedule for
    // overrun_ticks consecutive points. Raised once per overrun episode.
    virtual void on_overrun(double lag_seconds, std::size_t index) {}
};

// Configuration for real-time pacing.
// - tick_interval_s: wall-clock spacing between points
// - overrun_threshold_s / overrun_ticks: lag and persistence before warning
// - log_events: print lifecycle lines to stdout
struct PlaybackConfig {
    double      tick_interval_s     = kTickSeconds;
    double      overrun_threshold_s = 2.0;
    std::size_t overrun_ticks       = 5;
    bool        log_events          = true;
};

// PlaybackController
//
// Delivers a precomputed timeline to a sink at a fixed wall-clock cadence.
// Point i of a RUNNING period is due at anchor + (i - anchor_index) * tick;
// deadlines are absolute so slow callbacks compress later gaps instead of
// accumulating drift. Points are never skipped or reordered.
//
// IDLE -play-> RUNNING <-pause/resume-> PAUSED
// RUNNING -> COMPLETED one tick after the last point
// RUNNING|PAUSED -stop-> CANCELLED
class PlaybackController {
public:
    // The timeline and sink must outlive the controller.
    PlaybackController(const SimulationTimeline& timeline,
                       PlaybackSink* sink,
                       const PlaybackConfig& cfg = PlaybackConfig{});
    // Cancels and joins the playback thread if still running.
    ~PlaybackController();

    PlaybackController(const PlaybackController&) = delete;
    PlaybackController& operator=(const PlaybackController&) = delete;

    // Spawn the playback thread; point 0 is due immediately. Only from IDLE.
    bool play();
    // Stop advancing after the in-flight point (if any). Only from RUNNING.
    bool pause();
    // Re-anchor so the next point is due one tick from now. Only from PAUSED.
    bool resume();
    // Cancel from RUNNING or PAUSED and join the playback thread. Idempotent.
    // An in-flight callback finishes first. Safe to call from a sink callback.
    void stop();

    // Block until the run is terminal and its terminal callback has returned.
    void wait();
    // As wait(), bounded. Returns false on timeout.
    bool wait_for(double seconds);

    PlaybackState state() const;
    bool terminal() const;

    // Points delivered so far (callback returned).
    std::size_t emitted() const { return emitted_.load(std::memory_order_acquire); }

    const SimulationTimeline& timeline() const { return timeline_; }
    const PlaybackConfig& config() const { return cfg_; }

private:
    using Clock = std::chrono::steady_clock;

    // Playback thread: pace, deliver, then raise the terminal callback.
    void loop();
    void join_worker();

    const SimulationTimeline& timeline_;
    PlaybackSink* sink_;
    PlaybackConfig cfg_;
    Clock::duration tick_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    PlaybackState state_;
    bool finished_;            // terminal callback has returned

    // Pacing anchor of the current RUNNING period.
    Clock::time_point anchor_;
    std::size_t anchor_index_;
    uint64_t epoch_;           // bumped on every re-anchor or pause

    std::size_t next_;         // next point to deliver (guarded by mtx_)
    std::atomic<std::size_t> emitted_;
    std::size_t overrun_streak_;
    Clock::time_point started_;

    std::thread::id worker_id_;   // playback thread, set by loop() (guarded by mtx_)

    std::mutex join_mtx_;         // guards thread_
    std::thread thread_;
};

} // namespace powersim
