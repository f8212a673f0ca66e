#pragma once

#include "perftrack/report.hpp"

#include <glaze/glaze.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace perftrack::internal {

    // config.json as written by users; converted into perftrack::configuration after validation

    struct sampler_document {
        std::string policy{"uniform"};
        std::optional<double> mean{};
        double sigma{0.5};
        int max_retries{1'000};
    };

    struct target_document {
        std::string commit{};
        std::string bench_function{};
        std::optional<std::string> elf{};
    };

    struct bench_document {
        std::string parameter{};
        std::string output{};
        std::string description{};
        std::optional<sampler_document> sampler{};
        std::map<std::string, target_document> benches{};
    };

    struct settings_document {
        std::optional<std::string> tmp_root{};
        std::string workdir{"cli"};
        std::vector<std::string> build_command{"cargo", "build", "--release"};
        std::vector<std::string> bench_command{"cargo", "run", "--release", "bench"};
        int bench_timeout_ms{600'000};
        int build_timeout_ms{3'600'000};
        std::string on_bench_failure{"abort"};
    };

    struct config_document {
        int schema_version{1};
        std::optional<settings_document> settings{};
        std::map<std::string, bench_document> benches{};
    };

    // plots/<benchmark>.json, consumed by the external renderer

    struct fit_document {
        double slope{};
        double intercept{};
    };

    struct series_document {
        std::string label{};
        std::string revision{};
        bool plotted{false};
        size_t samples{};
        std::optional<fit_document> fit{};
        std::vector<double> parameters{};
        std::vector<double> metrics{};
        std::vector<double> fitted{};
    };

    struct report_document {
        int schema_version{1};
        std::string benchmark{};
        std::string description{};
        std::string x_label{};
        std::string y_label{};
        size_t num_samples{};
        std::vector<series_document> series{};
    };

}  // namespace perftrack::internal

namespace glz {

    template <>
    struct meta<perftrack::internal::sampler_document> {
        using T = perftrack::internal::sampler_document;
        static constexpr auto value =
                object("policy", &T::policy, "mean", &T::mean, "sigma", &T::sigma, "max_retries", &T::max_retries);
    };

    template <>
    struct meta<perftrack::internal::target_document> {
        using T = perftrack::internal::target_document;
        static constexpr auto value =
                object("commit", &T::commit, "bench_function", &T::bench_function, "elf", &T::elf);
    };

    template <>
    struct meta<perftrack::internal::bench_document> {
        using T = perftrack::internal::bench_document;
        static constexpr auto value =
                object("parameter",
                       &T::parameter,
                       "output",
                       &T::output,
                       "description",
                       &T::description,
                       "sampler",
                       &T::sampler,
                       "benches",
                       &T::benches);
    };

    template <>
    struct meta<perftrack::internal::settings_document> {
        using T = perftrack::internal::settings_document;
        static constexpr auto value =
                object("tmp_root",
                       &T::tmp_root,
                       "workdir",
                       &T::workdir,
                       "build_command",
                       &T::build_command,
                       "bench_command",
                       &T::bench_command,
                       "bench_timeout_ms",
                       &T::bench_timeout_ms,
                       "build_timeout_ms",
                       &T::build_timeout_ms,
                       "on_bench_failure",
                       &T::on_bench_failure);
    };

    template <>
    struct meta<perftrack::internal::config_document> {
        using T = perftrack::internal::config_document;
        static constexpr auto value =
                object("schema_version", &T::schema_version, "settings", &T::settings, "benches", &T::benches);
    };

    template <>
    struct meta<perftrack::internal::fit_document> {
        using T = perftrack::internal::fit_document;
        static constexpr auto value = object("slope", &T::slope, "intercept", &T::intercept);
    };

    template <>
    struct meta<perftrack::internal::series_document> {
        using T = perftrack::internal::series_document;
        static constexpr auto value =
                object("label",
                       &T::label,
                       "revision",
                       &T::revision,
                       "plotted",
                       &T::plotted,
                       "samples",
                       &T::samples,
                       "fit",
                       &T::fit,
                       "parameters",
                       &T::parameters,
                       "metrics",
                       &T::metrics,
                       "fitted",
                       &T::fitted);
    };

    template <>
    struct meta<perftrack::internal::report_document> {
        using T = perftrack::internal::report_document;
        static constexpr auto value =
                object("schema_version",
                       &T::schema_version,
                       "benchmark",
                       &T::benchmark,
                       "description",
                       &T::description,
                       "x_label",
                       &T::x_label,
                       "y_label",
                       &T::y_label,
                       "num_samples",
                       &T::num_samples,
                       "series",
                       &T::series);
    };

}  // namespace glz
