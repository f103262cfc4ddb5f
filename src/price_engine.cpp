#include "powersim/price_engine.hpp"
#include <algorithm>
#include <cmath>
#include <random>

namespace powersim {

    double jump_probability(const SimulationParameters& params, VolatilityRegime regime, double dt) {
        return params.jump_frequency * regime_config(regime).jump_probability_multiplier * dt / 60.0;
    }

    double effective_volatility(const SimulationParameters& params, VolatilityRegime regime) {
        return regime_config(regime).volatility_multiplier * params.max_volatility;
    }

    StepTerms sample_terms(double current_price,
                           VolatilityRegime regime,
                           const SimulationParameters& params,
                           double dt,
                           RandomSource& rng) {
        // Standard draws scaled afterwards: normal_distribution requires sigma > 0
        // and max_volatility may legitimately be 0.
        std::normal_distribution<double> nd(0.0, 1.0);
        std::uniform_real_distribution<double> ud(0.0, 1.0);

        const double eff_vol = effective_volatility(params, regime);

        StepTerms t{};
        t.drift     = (kLongTermMean - current_price) * params.mean_reversion_strength * dt;
        t.diffusion = nd(rng) * (eff_vol * 0.5) * std::sqrt(dt);

        t.jump_occurred = ud(rng) < jump_probability(params, regime, dt);
        t.jump = t.jump_occurred ? nd(rng) * (0.5 * eff_vol) : 0.0;
        return t;
    }

    PricePoint step(double current_price,
                    double timestamp,
                    VolatilityRegime regime,
                    const SimulationParameters& params,
                    double dt,
                    RandomSource& rng) {
        StepTerms t = sample_terms(current_price, regime, params, dt, rng);
        double next = std::clamp(current_price + t.drift + t.diffusion + t.jump, kPriceMin, kPriceMax);
        return PricePoint{timestamp, next, regime, t.jump_occurred};
    }
}
