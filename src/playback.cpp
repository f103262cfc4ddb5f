#include "powersim/playback.hpp"
#include "powersim/regime.hpp"
#include <iostream>

namespace powersim {

const char* playback_state_name(PlaybackState s) {
    switch (s) {
        case PlaybackState::Idle:      return "IDLE";
        case PlaybackState::Running:   return "RUNNING";
        case PlaybackState::Paused:    return "PAUSED";
        case PlaybackState::Completed: return "COMPLETED";
        case PlaybackState::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

PlaybackController::PlaybackController(const SimulationTimeline& timeline,
                                       PlaybackSink* sink,
                                       const PlaybackConfig& cfg)
    : timeline_(timeline),
      sink_(sink),
      cfg_(cfg),
      tick_(std::chrono::duration_cast<Clock::duration>(
          std::chrono::duration<double>(cfg.tick_interval_s))),
      state_(PlaybackState::Idle),
      finished_(false),
      anchor_index_(0),
      epoch_(0),
      next_(0),
      emitted_(0),
      overrun_streak_(0)
{}

PlaybackController::~PlaybackController() {
    stop();
    join_worker();
}

bool PlaybackController::play() {
    {
        std::lock_guard<std::mutex> g(mtx_);
        if (state_ != PlaybackState::Idle) return false;
        state_ = PlaybackState::Running;
        started_ = Clock::now();
        anchor_ = started_;
        anchor_index_ = 0;
        ++epoch_;
    }
    if (cfg_.log_events) {
        std::cout << "[PLAYBACK] start: " << timeline_.size() << " points @ "
                  << cfg_.tick_interval_s << "s" << std::endl;
    }
    std::lock_guard<std::mutex> g(join_mtx_);
    thread_ = std::thread(&PlaybackController::loop, this);
    return true;
}

bool PlaybackController::pause() {
    std::size_t at;
    {
        std::lock_guard<std::mutex> g(mtx_);
        if (state_ != PlaybackState::Running) return false;
        state_ = PlaybackState::Paused;
        ++epoch_;           // anchor is discarded; resume() sets a new one
        at = next_;
    }
    cv_.notify_all();
    if (cfg_.log_events) {
        std::cout << "[PLAYBACK] paused before point " << at << std::endl;
    }
    return true;
}

bool PlaybackController::resume() {
    std::size_t at;
    {
        std::lock_guard<std::mutex> g(mtx_);
        if (state_ != PlaybackState::Paused) return false;
        state_ = PlaybackState::Running;
        anchor_ = Clock::now() + tick_;
        anchor_index_ = next_;
        overrun_streak_ = 0;
        ++epoch_;
        at = next_;
    }
    cv_.notify_all();
    if (cfg_.log_events) {
        std::cout << "[PLAYBACK] resumed at point " << at << std::endl;
    }
    return true;
}

void PlaybackController::stop() {
    bool cancelled = false;
    bool on_worker;
    {
        std::lock_guard<std::mutex> g(mtx_);
        on_worker = (worker_id_ == std::this_thread::get_id());
        if (state_ == PlaybackState::Running || state_ == PlaybackState::Paused) {
            state_ = PlaybackState::Cancelled;
            ++epoch_;
            cancelled = true;
        }
    }
    if (cancelled) {
        cv_.notify_all();
        if (cfg_.log_events) {
            std::cout << "[PLAYBACK] stop requested" << std::endl;
        }
    }
    // From inside a sink callback the worker exits on its own once the
    // callback returns; it is joined later by the owner.
    if (!on_worker) {
        join_worker();
    }
}

void PlaybackController::join_worker() {
    {
        std::lock_guard<std::mutex> g(mtx_);
        if (worker_id_ == std::this_thread::get_id()) return;
    }
    std::lock_guard<std::mutex> g(join_mtx_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void PlaybackController::wait() {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait(lk, [this] { return finished_ || state_ == PlaybackState::Idle; });
}

bool PlaybackController::wait_for(double seconds) {
    std::unique_lock<std::mutex> lk(mtx_);
    return cv_.wait_for(lk, std::chrono::duration<double>(seconds),
                        [this] { return finished_ || state_ == PlaybackState::Idle; });
}

PlaybackState PlaybackController::state() const {
    std::lock_guard<std::mutex> g(mtx_);
    return state_;
}

bool PlaybackController::terminal() const {
    PlaybackState s = state();
    return s == PlaybackState::Completed || s == PlaybackState::Cancelled;
}

void PlaybackController::loop() {
    using namespace std::chrono;

    const std::size_t n = timeline_.size();
    std::size_t next_segment = 0;

    std::unique_lock<std::mutex> lk(mtx_);
    worker_id_ = std::this_thread::get_id();
    while (true) {
        cv_.wait(lk, [this] { return state_ != PlaybackState::Paused; });
        if (state_ != PlaybackState::Running) break;

        // Completion is due one tick after the last point, like any other deadline.
        const Clock::time_point deadline =
            anchor_ + tick_ * static_cast<Clock::rep>(next_ - anchor_index_);
        const uint64_t epoch = epoch_;

        // Single suspension point per tick. Returns at once when behind schedule.
        if (cv_.wait_until(lk, deadline, [this, epoch] {
                return state_ != PlaybackState::Running || epoch_ != epoch;
            })) {
            continue;   // paused, stopped or re-anchored
        }

        if (next_ >= n) {
            state_ = PlaybackState::Completed;
            break;
        }

        // Lag relative to the absolute schedule; only sustained lag is reported.
        const double lag = duration<double>(Clock::now() - deadline).count();
        bool report_overrun = false;
        if (lag > cfg_.overrun_threshold_s) {
            if (++overrun_streak_ == cfg_.overrun_ticks) report_overrun = true;
        } else {
            overrun_streak_ = 0;
        }

        const std::size_t index = next_;
        const PricePoint& p = timeline_[index];
        const bool announce = next_segment < timeline_.segments.size() &&
                              timeline_.segments[next_segment].start_index == index;

        // Deliver without holding the lock so pause/stop stay responsive;
        // they take effect once this callback returns.
        lk.unlock();
        if (report_overrun) {
            std::cerr << "[PLAYBACK] WARNING: " << lag << "s behind schedule at point "
                      << index << std::endl;
            sink_->on_overrun(lag, index);
        }
        if (announce) {
            if (cfg_.log_events) {
                std::cout << "[PLAYBACK] regime " << regime_name(p.regime)
                          << " from t=" << p.timestamp << "s" << std::endl;
            }
            sink_->on_regime_change(p.regime, p.timestamp);
        }
        sink_->on_point(p);
        lk.lock();

        if (announce) ++next_segment;
        next_ = index + 1;
        emitted_.store(next_, std::memory_order_release);
    }

    const PlaybackState final_state = state_;
    const std::size_t delivered = next_;
    lk.unlock();

    if (cfg_.log_events) {
        double elapsed = duration<double>(Clock::now() - started_).count();
        std::cout << "[PLAYBACK] " << playback_state_name(final_state) << " after "
                  << delivered << "/" << n << " points, " << elapsed << "s" << std::endl;
    }
    if (final_state == PlaybackState::Completed) {
        sink_->on_complete();
    } else {
        sink_->on_cancelled();
    }

    lk.lock();
    finished_ = true;
    lk.unlock();
    cv_.notify_all();
}

} // namespace powersim
