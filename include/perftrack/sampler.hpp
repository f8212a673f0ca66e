#pragma once

#include "config.hpp"

#include <cstdint>
#include <iosfwd>
#include <random>

namespace perftrack {

    // half-open parameter range [min_value, max_value)
    struct sample_bounds {
        int64_t min_value{};
        int64_t max_value{};
    };

    /*
     * Lazy, unbounded parameter source. Uniform draws are taken directly from the range; skewed draws
     * come from a log-normal centered on the configured mean and are rejection-sampled into the open
     * interval (min_value, max_value). After `max_retries` rejections a uniform draw is used instead and
     * the sampler configuration warning is written (once) to the warning stream.
     */
    class sampler {
        sample_bounds bounds_;
        sampler_settings settings_;
        std::mt19937_64 rng_;
        std::ostream* warnings_;
        uint64_t fallback_draws_{0};
        bool warned_{false};

        int64_t draw_uniform();
        int64_t draw_skewed();

      public:
        // throws std::invalid_argument for an empty range or an unusable skewed configuration
        sampler(sample_bounds bounds, sampler_settings settings, uint64_t seed, std::ostream* warnings = nullptr);

        int64_t next();

        const sample_bounds& bounds() const { return bounds_; }
        uint64_t fallback_draws() const { return fallback_draws_; }
    };

}  // namespace perftrack
