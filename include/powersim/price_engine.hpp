#pragma once
#include "powersim/regime.hpp"
#include "powersim/types.hpp"

/*
 Stochastic price engine:
 - Euler step of a mean-reverting process around kLongTermMean
 - Gaussian diffusion scaled by the regime's volatility multiplier
 - Bernoulli-triggered Gaussian jumps
 The sum is clamped once to [kPriceMin, kPriceMax]; components are never
 clamped individually.
*/

namespace powersim {

    // Components of a single step before clamping. Exposed for tests and
    // diagnostics; step() is the normal entry point.
    struct StepTerms {
        double drift;
        double diffusion;
        double jump;
        bool   jump_occurred;
    };

    // Per-tick jump probability: jump_frequency * regime multiplier * dt / 60.
    double jump_probability(const SimulationParameters& params, VolatilityRegime regime, double dt);

    // Effective volatility: regime multiplier * max_volatility.
    double effective_volatility(const SimulationParameters& params, VolatilityRegime regime);

    // Draw the stochastic terms of one step. Consumes, in order: one standard
    // normal (diffusion), one uniform (jump trigger), and one standard normal
    // only when a jump fires.
    StepTerms sample_terms(double current_price,
                           VolatilityRegime regime,
                           const SimulationParameters& params,
                           double dt,
                           RandomSource& rng);

    // Produce the price point for `timestamp` from the previous price.
    // Deterministic for a given rng state; never fails for vetted parameters.
    PricePoint step(double current_price,
                    double timestamp,
                    VolatilityRegime regime,
                    const SimulationParameters& params,
                    double dt,
                    RandomSource& rng);
}
