#include "perftrack/sampler.hpp"

#include "perftrack/format.hpp"

#include <cmath>
#include <ostream>
#include <stdexcept>

using namespace perftrack::literals;

namespace perftrack {

    sampler::sampler(sample_bounds bounds, sampler_settings settings, uint64_t seed, std::ostream* warnings)
            : bounds_{bounds}, settings_{settings}, rng_{seed}, warnings_{warnings} {
        if (bounds_.min_value >= bounds_.max_value) {
            throw std::invalid_argument(
                    "empty sampling range [{}, {})"_format(bounds_.min_value, bounds_.max_value));
        }
        if (settings_.policy == sample_policy::skewed) {
            if (!settings_.mean) {
                settings_.mean = (static_cast<double>(bounds_.min_value) + static_cast<double>(bounds_.max_value)) / 2.0;
            }
            if (!(*settings_.mean > 0.0)) {
                throw std::invalid_argument("skewed sampling needs a positive mean, got {}"_format(*settings_.mean));
            }
            if (!(settings_.sigma > 0.0) || settings_.max_retries <= 0) {
                throw std::invalid_argument("skewed sampling needs sigma > 0 and max_retries > 0");
            }
        }
    }

    int64_t sampler::draw_uniform() {
        std::uniform_int_distribution<int64_t> dist{bounds_.min_value, bounds_.max_value - 1};
        return dist(rng_);
    }

    int64_t sampler::draw_skewed() {
        // the median of lognormal(m, s) is exp(m)
        std::lognormal_distribution<double> dist{std::log(*settings_.mean), settings_.sigma};
        auto lo = static_cast<double>(bounds_.min_value);
        auto hi = static_cast<double>(bounds_.max_value);

        for (int attempt = 0; attempt < settings_.max_retries; ++attempt) {
            auto value = dist(rng_);
            if (value > lo && value < hi) {
                auto drawn = static_cast<int64_t>(std::floor(value));
                // guards against rounding at the very top of the range
                if (drawn >= bounds_.min_value && drawn < bounds_.max_value) {
                    return drawn;
                }
            }
        }

        ++fallback_draws_;
        if (!warned_ && warnings_ != nullptr) {
            *warnings_ << "warning: sampler configuration: no skewed draw (mean={}, sigma={}) landed in ({}, {}) "
                          "after {} attempts; falling back to uniform draws\n"_format(
                                  *settings_.mean,
                                  settings_.sigma,
                                  bounds_.min_value,
                                  bounds_.max_value,
                                  settings_.max_retries);
        }
        warned_ = true;
        return draw_uniform();
    }

    int64_t sampler::next() {
        switch (settings_.policy) {
            case sample_policy::uniform:
                return draw_uniform();
            case sample_policy::skewed:
                return draw_skewed();
        }
        return draw_uniform();
    }

}  // namespace perftrack
