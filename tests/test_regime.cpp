#include <catch2/catch.hpp>
#include "powersim/regime.hpp"
#include <set>
#include <string>

using namespace powersim;

TEST_CASE("regime table multipliers", "[regime]") {
    CHECK(regime_config(VolatilityRegime::Low).volatility_multiplier == 0.5);
    CHECK(regime_config(VolatilityRegime::Medium).volatility_multiplier == 1.0);
    CHECK(regime_config(VolatilityRegime::High).volatility_multiplier == 1.5);

    CHECK(regime_config(VolatilityRegime::Low).jump_probability_multiplier == 1.0);
    CHECK(regime_config(VolatilityRegime::Medium).jump_probability_multiplier == 1.5);
    CHECK(regime_config(VolatilityRegime::High).jump_probability_multiplier == 2.0);

    CHECK(std::string(regime_name(VolatilityRegime::High)) == "HIGH");
}

TEST_CASE("scheduler switches only at 30s boundaries", "[regime]") {
    RandomSource rng(42);
    RegimeScheduler sched;
    sched.initialize(rng);

    REQUIRE(sched.segment_start_time() == 0.0);
    REQUIRE(sched.next_switch_time() == 30.0);

    SECTION("no switch inside the first segment") {
        for (int i = 0; i < 150; ++i) {
            REQUIRE_FALSE(sched.advance(i * 0.2));
        }
        CHECK(sched.next_switch_time() == 30.0);
    }

    SECTION("accumulated tick clock still hits the boundary") {
        // 150 * 0.2 is not exactly 30.0 in binary floating point
        REQUIRE(sched.advance(150 * 0.2));
        CHECK(sched.segment_start_time() == 30.0);
        CHECK(sched.next_switch_time() == 60.0);
        CHECK_FALSE(sched.advance(151 * 0.2));
    }

    SECTION("every boundary crossed in one call is consumed") {
        REQUIRE(sched.advance(95.0));
        CHECK(sched.segment_start_time() == 90.0);
        CHECK(sched.next_switch_time() == 120.0);
    }
}

TEST_CASE("scheduler draws are uniform and may repeat", "[regime]") {
    RandomSource rng(7);
    RegimeScheduler sched;
    sched.initialize(rng);

    int counts[3] = {0, 0, 0};
    int repeats = 0;
    VolatilityRegime prev = sched.current_regime();
    const int draws = 30000;
    for (int k = 1; k <= draws; ++k) {
        sched.advance(k * 30.0);
        VolatilityRegime r = sched.current_regime();
        counts[static_cast<int>(r)]++;
        if (r == prev) ++repeats;
        prev = r;
    }

    for (int c : counts) {
        CHECK(c > draws / 3 - 600);
        CHECK(c < draws / 3 + 600);
    }
    // Independent draws: about a third of switches keep the same regime.
    CHECK(repeats > draws / 4);
}

TEST_CASE("scheduler is reproducible for a seed", "[regime]") {
    RandomSource a(2024), b(2024);
    RegimeScheduler sa, sb;
    sa.initialize(a);
    sb.initialize(b);
    for (int k = 0; k <= 6; ++k) {
        sa.advance(k * 30.0);
        sb.advance(k * 30.0);
        REQUIRE(sa.current_regime() == sb.current_regime());
    }
}

TEST_CASE("custom switch interval", "[regime]") {
    RandomSource rng(1);
    RegimeScheduler sched(10.0);
    sched.initialize(rng);
    CHECK(sched.switch_interval() == 10.0);
    CHECK(RegimeScheduler().switch_interval() == kRegimeSwitchSeconds);
    CHECK(sched.next_switch_time() == 10.0);
    CHECK_FALSE(sched.advance(9.8));
    CHECK(sched.advance(10.0));
    CHECK(sched.state().next_switch_time == 20.0);
}
