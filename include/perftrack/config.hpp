#pragma once

#include "utils.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack {

    using namespace std::string_view_literals;

    /*
     * Perftrack configuration
     *
     * config.json (read-only input)
     * - schema_version: Document version; newer versions than supported are rejected.
     * - settings.tmp_root: Root under which revisions are materialized (<tmp_root>/<revision>).
     * - settings.workdir: Sub-path of a materialized revision used as build/bench working directory.
     * - settings.build_command: Build toolchain invocation (release/optimized mode).
     * - settings.bench_command: Benchmark invocation prefix; entry point and parameter are appended.
     * - settings.bench_timeout_ms: Ceiling for a single benchmark subprocess.
     * - settings.build_timeout_ms: Ceiling for a single build subprocess.
     * - settings.on_bench_failure: Sampling-loop policy for a failed sample (abort|skip).
     * - benches.<name>.parameter/output: The two measurement table column names.
     * - benches.<name>.description: Human description carried into reports.
     * - benches.<name>.sampler: Parameter distribution (uniform|skewed with mean/sigma/max_retries).
     * - benches.<name>.benches.<label>: {commit, bench_function, elf?} compared series.
     *
     * Startup options (command line)
     * - config_path: Path to config.json.
     * - root: Project root holding build/, data/ and plots/; the VCS operates on it.
     * - tmp_root: Overrides settings.tmp_root.
     * - output: stdout shape for reports (table|json).
     * - quiet/verbose: Progress verbosity.
     */

    // revision id denoting the live working tree; never materialized, never deleted
    inline constexpr auto current_checkout = "current"sv;

    enum class sample_policy { uniform, skewed };
    enum class failure_policy { abort, skip };
    enum class output_mode { table, json };

    inline constexpr std::string_view to_string(sample_policy policy) {
        switch (policy) {
            case sample_policy::uniform:
                return "uniform"sv;
            case sample_policy::skewed:
                return "skewed"sv;
        }
        return "uniform"sv;
    }

    inline constexpr bool try_parse_sample_policy(std::string_view text, sample_policy& out) {
        if (utils::str_case_eq(text, "uniform"sv)) {
            out = sample_policy::uniform;
            return true;
        }
        if (utils::str_case_eq(text, "skewed"sv) || utils::str_case_eq(text, "lognormal"sv)) {
            out = sample_policy::skewed;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(failure_policy policy) {
        switch (policy) {
            case failure_policy::abort:
                return "abort"sv;
            case failure_policy::skip:
                return "skip"sv;
        }
        return "abort"sv;
    }

    inline constexpr bool try_parse_failure_policy(std::string_view text, failure_policy& out) {
        if (utils::str_case_eq(text, "abort"sv)) {
            out = failure_policy::abort;
            return true;
        }
        if (utils::str_case_eq(text, "skip"sv)) {
            out = failure_policy::skip;
            return true;
        }
        return false;
    }

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    struct sampler_settings {
        sample_policy policy{sample_policy::uniform};
        // center of the skewed distribution; midpoint of the bounds when unset
        std::optional<double> mean{};
        double sigma{0.5};
        int max_retries{1'000};
    };

    struct bench_target {
        std::string label{};
        std::string revision{};
        std::string bench_function{};
        std::optional<std::filesystem::path> elf{};
    };

    struct bench_descriptor {
        std::string name{};
        std::string parameter{};
        std::string output{};
        std::string description{};
        sampler_settings sampler{};
        std::vector<bench_target> targets{};

        const bench_target* find_target(std::string_view label) const;
    };

    struct tool_settings {
        std::filesystem::path tmp_root{};
        std::filesystem::path workdir{"cli"};
        std::vector<std::string> build_command{"cargo", "build", "--release"};
        std::vector<std::string> bench_command{"cargo", "run", "--release", "bench"};
        int bench_timeout_ms{600'000};
        int build_timeout_ms{3'600'000};
        failure_policy on_bench_failure{failure_policy::abort};
    };

    struct configuration {
        int schema_version{1};
        tool_settings settings{};
        std::vector<bench_descriptor> benches{};

        // throws config_error for an unknown benchmark
        const bench_descriptor& benchmark(std::string_view name) const;
    };

    inline constexpr int supported_schema_version = 1;

    std::filesystem::path default_tmp_root();

    configuration parse_configuration(std::string_view json, std::string_view origin = "<memory>"sv);
    configuration load_configuration(const std::filesystem::path& path);

    struct startup_config {
        std::filesystem::path config_path{"config.json"};
        std::filesystem::path root{"."};
        std::optional<std::filesystem::path> tmp_root{};
        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};
        bool print_config{false};
    };

    // on-disk layout shared by the store, the orchestrator and the cli
    struct project_layout {
        std::filesystem::path root{"."};
        std::filesystem::path tmp_root{};

        std::filesystem::path build_dir() const { return root / "build"; }
        std::filesystem::path data_dir() const { return root / "data"; }
        std::filesystem::path plot_dir() const { return root / "plots"; }

        std::filesystem::path link_dir(std::string_view benchmark) const { return build_dir() / benchmark; }
        std::filesystem::path link_path(std::string_view benchmark, std::string_view label) const {
            return link_dir(benchmark) / label;
        }
        std::filesystem::path table_dir(std::string_view benchmark) const { return data_dir() / benchmark; }
        std::filesystem::path table_path(std::string_view benchmark, std::string_view label) const {
            return table_dir(benchmark) / (std::string{label} + ".csv");
        }
        std::filesystem::path report_path(std::string_view benchmark) const {
            return plot_dir() / (std::string{benchmark} + ".json");
        }
    };

}  // namespace perftrack
