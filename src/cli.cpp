#include "perftrack/cli.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"
#include "perftrack/orchestrator.hpp"
#include "perftrack/report.hpp"
#include "perftrack/utils.hpp"

#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

using namespace perftrack::literals;

namespace perftrack::cli {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr auto version = "perftrack 0.1.0"sv;

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "config=" << cfg.config_path.string() << '\n';
            os << "root=" << cfg.root.string() << '\n';
            os << "tmp_root=" << (cfg.tmp_root ? cfg.tmp_root->string() : "<settings>") << '\n';
            os << "output=" << to_string(cfg.output) << '\n';
            os << "quiet=" << (cfg.quiet ? "true" : "false") << '\n';
            os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
        }

        static void print_configuration(const configuration& config, std::ostream& os) {
            os << "schema_version=" << config.schema_version << '\n';
            os << "settings.tmp_root=" << config.settings.tmp_root.string() << '\n';
            os << "settings.workdir=" << config.settings.workdir.string() << '\n';
            os << "settings.build_command=" << utils::join_with_separator(config.settings.build_command, " "sv)
               << '\n';
            os << "settings.bench_command=" << utils::join_with_separator(config.settings.bench_command, " "sv)
               << '\n';
            os << "settings.bench_timeout_ms=" << config.settings.bench_timeout_ms << '\n';
            os << "settings.on_bench_failure=" << to_string(config.settings.on_bench_failure) << '\n';
            for (const auto& bench : config.benches) {
                os << "bench " << bench.name << ": " << bench.parameter << " -> " << bench.output << " ("
                   << to_string(bench.sampler.policy) << ")\n";
                for (const auto& target : bench.targets) {
                    os << "  " << target.label << " = " << target.revision << " :: " << target.bench_function;
                    if (target.elf) {
                        os << " [elf " << target.elf->string() << ']';
                    }
                    os << '\n';
                }
            }
        }

        static project_layout make_layout(const startup_config& cfg, const configuration& config) {
            project_layout layout{};
            layout.root = cfg.root;
            layout.tmp_root = cfg.tmp_root ? *cfg.tmp_root : config.settings.tmp_root;
            return layout;
        }

        // stage a command is in when an error escapes without one
        static failure_stage stage_of(command_kind kind) {
            switch (kind) {
                case command_kind::build:
                    return failure_stage::build;
                case command_kind::bench:
                    return failure_stage::sample;
                case command_kind::clean:
                    return failure_stage::link;
                case command_kind::cleancsv:
                    return failure_stage::append;
                case command_kind::plot:
                    return failure_stage::report;
                case command_kind::none:
                    break;
            }
            return failure_stage::config;
        }

        static void report_error(const error& e, std::ostream& err) {
            err << "error: [" << to_string(e.stage()) << "] " << e.subject() << ": " << e.what() << '\n';
            if (const auto* failed = dynamic_cast<const build_failed*>(&e);
                failed != nullptr && !failed->output().empty()) {
                err << "build output:\n" << utils::trim_view(failed->output()) << '\n';
            }
            if (e.stage() == failure_stage::sample) {
                if (const auto* failed = dynamic_cast<const bench_failed*>(&e);
                    failed != nullptr && !failed->stderr_output().empty()) {
                    err << "benchmark stderr:\n" << utils::trim_view(failed->stderr_output()) << '\n';
                }
            }
            if (e.stage() == failure_stage::sample || e.stage() == failure_stage::append) {
                err << "measurements appended so far are intact; rerun bench to resume\n";
            }
        }

        static int run_build(const configuration& config, orchestrator& orch, const command_request& request) {
            orch.build(config.benchmark(request.benchmark));
            return 0;
        }

        static int run_bench(
                const configuration& config,
                orchestrator& orch,
                const command_request& request,
                std::stop_token stop,
                std::ostream& out,
                bool quiet) {
            bench_options options{};
            options.bounds = sample_bounds{.min_value = request.min_value, .max_value = request.max_value};
            options.iterations = request.iterations;
            options.seed = request.seed;

            auto summary = orch.bench(config.benchmark(request.benchmark), options, stop);
            if (!quiet) {
                for (const auto& [label, count] : summary.samples_per_label) {
                    out << "  " << label << ": " << count << '\n';
                }
                if (summary.skipped > 0U) {
                    out << "  skipped: " << summary.skipped << '\n';
                }
            }
            return 0;
        }

        static int run_clean(
                const configuration& config, revision_store& revisions, const command_request& request, std::ostream& out) {
            // validates the name; links are scanned from disk, not from the label list
            static_cast<void>(config.benchmark(request.benchmark));
            auto dir = revisions.layout().link_dir(request.benchmark);
            std::error_code ec{};
            if (!fs::exists(dir, ec)) {
                out << "no built revisions found for " << request.benchmark << '\n';
                return 0;
            }
            auto released = revisions.release_all(request.benchmark);
            out << "released " << released << " revision link(s) for " << request.benchmark << '\n';
            return 0;
        }

        static int run_cleancsv(
                const configuration& config, measurement_store& store, const command_request& request, std::ostream& out) {
            // only configured benchmarks own a directory under data/
            static_cast<void>(config.benchmark(request.benchmark));
            auto removed = store.remove_benchmark(request.benchmark);
            if (removed == 0U) {
                out << "no csv files found for " << request.benchmark << '\n';
                return 0;
            }
            out << "removed " << removed << " csv file(s) for " << request.benchmark << '\n';
            return 0;
        }

        static int run_plot(
                const startup_config& cfg,
                const configuration& config,
                const measurement_store& store,
                const project_layout& layout,
                const command_request& request,
                std::ostream& out,
                std::ostream& err) {
            report_assembler assembler{config, store};
            auto report = assembler.assemble(request.benchmark);

            auto path = layout.report_path(request.benchmark);
            write_report(report, path);

            for (const auto& series : report.series) {
                if (!series.plotted) {
                    err << "warning: {}/{} has no samples yet; listed but not plotted\n"_format(
                            report.benchmark, series.label);
                }
            }

            if (cfg.output == output_mode::json) {
                out << to_json(report) << '\n';
            }
            else {
                print_report_table(report, out);
                if (!cfg.quiet) {
                    out << "report written to " << path.string() << '\n';
                }
            }
            return 0;
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request) {
        CLI::App app{"perftrack: track benchmark performance across revisions"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        std::string config_arg{cfg.config_path.string()};
        std::string root_arg{cfg.root.string()};
        std::string tmp_root_arg{};
        std::string output_arg{std::string{to_string(cfg.output)}};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("-c,--config", config_arg, "Benchmark configuration (json)");
        app.add_option("--root", root_arg, "Project root holding build/, data/ and plots/");
        app.add_option("--tmp-root", tmp_root_arg, "Directory revisions are materialized under");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("-q,--quiet", cfg.quiet, "Suppress progress output");
        app.add_flag("-v,--verbose", cfg.verbose, "Print every subprocess command");

        std::string benchmark{};
        int64_t min_value{};
        int64_t max_value{};
        size_t iterations{};
        uint64_t seed{};

        auto* build = app.add_subcommand("build", "Materialize and build every revision of a benchmark");
        build->add_option("benchmark", benchmark, "Benchmark name")->required();

        auto* bench = app.add_subcommand("bench", "Sample a benchmark until interrupted");
        bench->add_option("benchmark", benchmark, "Benchmark name")->required();
        bench->add_option("min", min_value, "Smallest parameter (inclusive)")->required();
        bench->add_option("max", max_value, "Largest parameter (exclusive)")->required();
        auto* iterations_opt = bench->add_option("-n,--iterations", iterations, "Stop after this many samples");
        auto* seed_opt = bench->add_option("--seed", seed, "Seed for label choice and sampling");

        auto* clean = app.add_subcommand("clean", "Release a benchmark's revisions, deleting unreferenced ones");
        clean->add_option("benchmark", benchmark, "Benchmark name")->required();

        auto* cleancsv = app.add_subcommand("cleancsv", "Delete a benchmark's measurement tables");
        cleancsv->add_option("benchmark", benchmark, "Benchmark name")->required();

        auto* plot = app.add_subcommand("plot", "Assemble the plot data and regression lines of a benchmark");
        plot->add_option("benchmark", benchmark, "Benchmark name")->required();

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }

        cfg.config_path = config_arg;
        cfg.root = root_arg;
        if (auto trimmed = utils::trim_view(tmp_root_arg); !trimmed.empty()) {
            cfg.tmp_root = std::filesystem::path{trimmed};
        }

        if (show_version) {
            std::cout << detail::version << '\n';
            return std::optional<int>{0};
        }

        request.benchmark = benchmark;
        if (build->parsed()) {
            request.kind = command_kind::build;
        }
        else if (bench->parsed()) {
            request.kind = command_kind::bench;
            request.min_value = min_value;
            request.max_value = max_value;
            if (min_value >= max_value) {
                std::cerr << "invalid range: min ({}) must be below max ({})\n"_format(min_value, max_value);
                return std::optional<int>{2};
            }
            if (iterations_opt->count() > 0U) {
                request.iterations = iterations;
            }
            if (seed_opt->count() > 0U) {
                request.seed = seed;
            }
        }
        else if (clean->parsed()) {
            request.kind = command_kind::clean;
        }
        else if (cleancsv->parsed()) {
            request.kind = command_kind::cleancsv;
        }
        else if (plot->parsed()) {
            request.kind = command_kind::plot;
        }

        if (request.kind == command_kind::none && !cfg.print_config) {
            std::cerr << app.help();
            return std::optional<int>{2};
        }
        return std::nullopt;
    }

    int run_command(
            const startup_config& cfg,
            const command_request& request,
            std::stop_token stop,
            std::ostream& out,
            std::ostream& err) {
        try {
            auto config = load_configuration(cfg.config_path);
            auto layout = detail::make_layout(cfg, config);

            if (cfg.print_config) {
                detail::print_config(cfg, out);
                detail::print_configuration(config, out);
                if (request.kind == command_kind::none) {
                    return 0;
                }
            }

            auto* trace = cfg.verbose ? &err : nullptr;
            git_version_control vcs{layout.root, config.settings.build_timeout_ms, trace};
            revision_store revisions{config, layout, vcs, out};
            measurement_store store{layout, &err};

            switch (request.kind) {
                case command_kind::build:
                case command_kind::bench: {
                    builder build_tool{config.settings, trace};
                    benchmark_runner runner{config.settings, trace};
                    orchestrator orch{config, revisions, build_tool, runner, store, out, err, cfg.quiet};
                    if (request.kind == command_kind::build) {
                        return detail::run_build(config, orch, request);
                    }
                    return detail::run_bench(config, orch, request, stop, out, cfg.quiet);
                }
                case command_kind::clean:
                    return detail::run_clean(config, revisions, request, out);
                case command_kind::cleancsv:
                    return detail::run_cleancsv(config, store, request, out);
                case command_kind::plot:
                    return detail::run_plot(cfg, config, store, layout, request, out, err);
                case command_kind::none:
                    break;
            }
            return 0;
        } catch (const error& e) {
            detail::report_error(e, err);
            return 1;
        } catch (const std::exception& e) {
            // filesystem and system errors from below the domain layer
            err << "error: [" << to_string(detail::stage_of(request.kind)) << "] "
                << (request.benchmark.empty() ? cfg.config_path.string() : request.benchmark) << ": " << e.what()
                << '\n';
            return 1;
        }
    }

}  // namespace perftrack::cli
