#include "powersim/session.hpp"
#include <exception>
#include <iostream>

namespace powersim {

SimulationSession::SimulationSession(PlaybackSink* sink, const SessionConfig& cfg)
    : sink_(sink),
      cfg_(cfg),
      generator_(cfg.timeline)
{}

SimulationSession::~SimulationSession() {
    stop();
}

bool SimulationSession::start(const SimulationParameters& params, uint64_t seed) {
    std::lock_guard<std::mutex> g(mtx_);

    // Parameters are locked while a run is live; a finished run (terminal
    // callback returned) is replaced.
    if (player_ && !player_->wait_for(0.0)) {
        if (cfg_.log_events) {
            std::cerr << "[SESSION] start rejected: run is "
                      << playback_state_name(player_->state()) << std::endl;
        }
        return false;
    }
    player_.reset();
    timeline_.reset();
    params_ = params;

    std::shared_ptr<const SimulationTimeline> tl;
    try {
        tl = std::make_shared<SimulationTimeline>(generator_.generate(params, seed));
    } catch (const std::exception& e) {
        std::cerr << "[SESSION] FATAL: timeline generation failed: " << e.what() << std::endl;
        return false;
    }

    if (cfg_.log_events) {
        std::cout << "[SESSION] generated " << tl->size() << " points, "
                  << tl->segments.size() << " regime segments, "
                  << tl->jump_count() << " jumps (seed=" << tl->seed
                  << ", vol=" << params.max_volatility
                  << ", kappa=" << params.mean_reversion_strength
                  << ", jumps/min=" << params.jump_frequency << ")" << std::endl;
    }

    timeline_ = tl;
    player_ = std::make_shared<PlaybackController>(*timeline_, sink_, cfg_.playback);
    return player_->play();
}

bool SimulationSession::pause() {
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        p = player_;
    }
    return p ? p->pause() : false;
}

bool SimulationSession::resume() {
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        p = player_;
    }
    return p ? p->resume() : false;
}

void SimulationSession::stop() {
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        p = player_;
    }
    // Outside the lock: stop() joins the playback thread, whose callbacks may
    // query this session.
    if (p) p->stop();
}

void SimulationSession::wait() {
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        p = player_;
    }
    if (p) p->wait();
}

bool SimulationSession::reset() {
    // Released after `old`: the controller references the timeline.
    std::shared_ptr<const SimulationTimeline> old_timeline;
    std::shared_ptr<PlaybackController> old;
    {
        std::lock_guard<std::mutex> g(mtx_);
        if (player_ && !player_->wait_for(0.0)) return false;
        old.swap(player_);
        old_timeline.swap(timeline_);
    }
    if (cfg_.log_events) {
        std::cout << "[SESSION] reset" << std::endl;
    }
    return true;
}

SessionSnapshot SimulationSession::snapshot() const {
    std::shared_ptr<const SimulationTimeline> tl;
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        tl = timeline_;
        p = player_;
    }

    SessionSnapshot s;
    s.current_price = cfg_.timeline.initial_price;
    if (!tl || !p) return s;

    s.state   = p->state();
    s.total   = tl->size();
    s.emitted = p->emitted();
    s.elapsed = static_cast<double>(s.emitted) * tl->dt;
    if (!tl->segments.empty()) s.regime = tl->segments.front().regime;

    if (s.emitted > 0) {
        const PricePoint& last = (*tl)[s.emitted - 1];
        s.current_price = last.price;
        s.regime = last.regime;
    }
    for (std::size_t i = 0; i < s.emitted; ++i)
        if ((*tl)[i].jump_occurred) ++s.jumps;
    return s;
}

PlaybackState SimulationSession::state() const {
    std::shared_ptr<PlaybackController> p;
    {
        std::lock_guard<std::mutex> g(mtx_);
        p = player_;
    }
    return p ? p->state() : PlaybackState::Idle;
}

SimulationParameters SimulationSession::parameters() const {
    std::lock_guard<std::mutex> g(mtx_);
    return params_;
}

std::shared_ptr<const SimulationTimeline> SimulationSession::timeline() const {
    std::lock_guard<std::mutex> g(mtx_);
    return timeline_;
}

} // namespace powersim
