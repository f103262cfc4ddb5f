#include <catch2/catch.hpp>
#include "powersim/session.hpp"
#include "recording_sink.hpp"
#include <chrono>
#include <thread>

using namespace powersim;
using namespace powersim_test;
using std::chrono::milliseconds;

namespace {
    SessionConfig fast_session(double tick_s) {
        SessionConfig cfg;
        cfg.playback = fast_config(tick_s);
        cfg.log_events = false;
        return cfg;
    }
}

TEST_CASE("idle session snapshot", "[session]") {
    RecordingSink sink;
    SimulationSession session(&sink, fast_session(0.001));

    SessionSnapshot s = session.snapshot();
    CHECK(s.state == PlaybackState::Idle);
    CHECK(s.current_price == 100.0);
    CHECK(s.emitted == 0);
    CHECK(s.elapsed == 0.0);
    CHECK(session.timeline() == nullptr);
    CHECK_FALSE(session.pause());
    CHECK_FALSE(session.resume());
    session.stop();
    CHECK(session.reset());
}

TEST_CASE("start generates the whole timeline before delivery", "[session]") {
    RecordingSink sink;
    SimulationSession session(&sink, fast_session(0.0005));

    SimulationParameters p{20.0, 0.1, 3.0};
    REQUIRE(session.start(p, 1234));

    auto tl = session.timeline();
    REQUIRE(tl != nullptr);
    CHECK(tl->size() == 900);
    CHECK(tl->seed == 1234);

    session.wait();
    CHECK(session.state() == PlaybackState::Completed);

    auto got = sink.points();
    REQUIRE(got.size() == 900);
    CHECK(delivered_in_order(got, *tl));

    SessionSnapshot s = session.snapshot();
    CHECK(s.emitted == 900);
    CHECK(s.total == 900);
    CHECK(s.elapsed == Approx(180.0));
    CHECK(s.current_price == tl->points.back().price);
    CHECK(s.regime == tl->points.back().regime);
    CHECK(s.jumps == tl->jump_count());
}

TEST_CASE("parameters are locked while a run is live", "[session]") {
    RecordingSink sink;
    SimulationSession session(&sink, fast_session(0.05));

    SimulationParameters first{10.0, 0.05, 1.0};
    REQUIRE(session.start(first, 7));
    REQUIRE(sink.wait_for_points(1, milliseconds(2000)));

    CHECK_FALSE(session.start(SimulationParameters{40.0, 0.4, 5.0}, 8));
    CHECK_FALSE(session.reset());
    CHECK(session.parameters().max_volatility == 10.0);

    REQUIRE(session.pause());
    CHECK_FALSE(session.start(SimulationParameters{40.0, 0.4, 5.0}, 8));
    CHECK(session.snapshot().state == PlaybackState::Paused);

    session.stop();
    CHECK(session.state() == PlaybackState::Cancelled);
    CHECK(sink.cancelled() == 1);

    // Terminal: new parameters are accepted.
    REQUIRE(session.reset());
    CHECK(session.timeline() == nullptr);
    CHECK(session.state() == PlaybackState::Idle);
}

TEST_CASE("snapshot tracks delivery progress", "[session]") {
    RecordingSink sink;
    SimulationSession session(&sink, fast_session(0.01));

    const std::size_t pause_after = 40;
    sink.after_point = [&](std::size_t n) {
        if (n == pause_after) session.pause();
    };

    REQUIRE(session.start(SimulationParameters{}, 99));
    REQUIRE(sink.wait_for_points(pause_after, milliseconds(3000)));
    std::this_thread::sleep_for(milliseconds(100));

    auto tl = session.timeline();
    SessionSnapshot s = session.snapshot();
    CHECK(s.state == PlaybackState::Paused);
    CHECK(s.emitted == pause_after);
    CHECK(s.elapsed == Approx(pause_after * 0.2));
    CHECK(s.current_price == (*tl)[pause_after - 1].price);
    CHECK(s.regime == (*tl)[pause_after - 1].regime);

    std::size_t jumps = 0;
    for (std::size_t i = 0; i < pause_after; ++i)
        if ((*tl)[i].jump_occurred) ++jumps;
    CHECK(s.jumps == jumps);

    session.stop();
}

TEST_CASE("finished session accepts a new run", "[session]") {
    RecordingSink sink;
    SimulationSession session(&sink, fast_session(0.0002));

    REQUIRE(session.start(SimulationParameters{0.0, 0.05, 0.0}, 5));
    session.wait();
    CHECK(sink.completed() == 1);
    for (const auto& p : sink.points()) REQUIRE(p.price == 100.0);

    REQUIRE(session.start(SimulationParameters{30.0, 0.2, 2.0}, 6));
    session.wait();
    CHECK(sink.completed() == 2);
    CHECK(session.parameters().max_volatility == 30.0);
    CHECK(session.timeline()->seed == 6);
}
