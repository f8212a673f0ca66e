#pragma once

#include "builder.hpp"
#include "config.hpp"
#include "measurement_store.hpp"
#include "revision_store.hpp"
#include "runner.hpp"
#include "sampler.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace perftrack {

    enum class run_state : uint8_t { idle, building, sampling, stopped, failed };

    inline constexpr std::string_view to_string(run_state state) {
        switch (state) {
            case run_state::idle:
                return "idle"sv;
            case run_state::building:
                return "building"sv;
            case run_state::sampling:
                return "sampling"sv;
            case run_state::stopped:
                return "stopped"sv;
            case run_state::failed:
                return "failed"sv;
        }
        return "idle"sv;
    }

    struct prepared_target {
        const bench_target* target{};
        std::filesystem::path materialized{};
        std::filesystem::path workdir{};
    };

    struct bench_options {
        sample_bounds bounds{};
        // successful samples to take; unbounded when unset
        std::optional<size_t> iterations{};
        std::optional<uint64_t> seed{};
    };

    struct run_summary {
        run_state state{run_state::idle};
        size_t samples{0};
        size_t skipped{0};
        std::map<std::string, size_t> samples_per_label{};
    };

    /*
     * Drives one benchmark run: Idle -> Building -> Sampling -> {Stopped, Failed}.
     *
     * Building materializes, links and builds every label and fails fast on the first error. Every table
     * is opened against the benchmark's schema before the first sample, so schema conflicts surface
     * before any time is spent sampling. The sampling loop is sequential and checks the stop token only
     * between iterations; an in-flight benchmark is always allowed to finish and its row is kept.
     */
    class orchestrator {
        const configuration& cfg_;
        revision_store& revisions_;
        const builder& builder_;
        const benchmark_runner& runner_;
        measurement_store& store_;
        std::ostream& out_;
        std::ostream& err_;
        bool quiet_;
        run_state state_{run_state::idle};

        std::vector<prepared_target> prepare(const bench_descriptor& bench);

      public:
        orchestrator(
                const configuration& cfg,
                revision_store& revisions,
                const builder& builder,
                const benchmark_runner& runner,
                measurement_store& store,
                std::ostream& out,
                std::ostream& err,
                bool quiet = false);

        run_state state() const { return state_; }

        // throws revision_unavailable, link_conflict or build_failed naming the label
        std::vector<prepared_target> build(const bench_descriptor& bench);

        run_summary bench(const bench_descriptor& bench, const bench_options& options, std::stop_token stop = {});
    };

}  // namespace perftrack
