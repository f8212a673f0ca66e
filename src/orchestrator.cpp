#include "perftrack/orchestrator.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include <ostream>
#include <random>
#include <stdexcept>

using namespace perftrack::literals;

namespace perftrack {

    namespace detail {

        // under the skip policy, give up once this many samples in a row have failed
        static constexpr size_t max_consecutive_failures = 16U;

        static std::string subject_of(const bench_descriptor& bench, const bench_target& target) {
            return "{}/{}"_format(bench.name, target.label);
        }

        static std::string output_tail(std::string_view text, size_t lines = 20U) {
            text = utils::trim_view(text);
            size_t pos = text.size();
            while (lines > 0U && pos > 0U) {
                auto nl = text.rfind('\n', pos - 1U);
                if (nl == std::string_view::npos) {
                    pos = 0U;
                    break;
                }
                pos = nl;
                --lines;
            }
            return std::string{utils::trim_view(text.substr(pos))};
        }

        static void require_success(const build_result& result, const std::string& subject, std::string_view what) {
            if (result.success) {
                return;
            }
            auto reason = result.timed_out ? std::string{"timed out"} : "exit code {}"_format(result.exit_code);
            throw build_failed(
                    subject,
                    result.exit_code,
                    result.output,
                    "{} build in {} failed ({}):\n{}"_format(
                            what, result.working_directory.string(), reason, output_tail(result.output)));
        }

    }  // namespace detail

    orchestrator::orchestrator(
            const configuration& cfg,
            revision_store& revisions,
            const builder& builder,
            const benchmark_runner& runner,
            measurement_store& store,
            std::ostream& out,
            std::ostream& err,
            bool quiet)
            : cfg_{cfg},
              revisions_{revisions},
              builder_{builder},
              runner_{runner},
              store_{store},
              out_{out},
              err_{err},
              quiet_{quiet} {}

    std::vector<prepared_target> orchestrator::prepare(const bench_descriptor& bench) {
        state_ = run_state::building;

        std::vector<prepared_target> prepared{};
        prepared.reserve(bench.targets.size());

        for (const auto& target : bench.targets) {
            auto subject = detail::subject_of(bench, target);

            std::filesystem::path materialized{};
            try {
                materialized = revisions_.ensure_materialized(target.revision);
            } catch (const revision_unavailable& e) {
                throw revision_unavailable("{} ({})"_format(subject, target.revision), e.what());
            }
            revisions_.retain_reference(bench.name, target.label, target.revision);

            if (target.elf) {
                if (!quiet_) {
                    out_ << "building artifact " << target.elf->string() << " for " << subject << '\n';
                }
                detail::require_success(builder_.build(materialized / *target.elf), subject, "artifact");
            }

            auto workdir = revisions_.workdir(target.revision);
            if (!quiet_) {
                out_ << "building " << subject << " (" << target.revision << ")\n";
            }
            detail::require_success(builder_.build(workdir), subject, "release");

            prepared.push_back(prepared_target{.target = &target, .materialized = materialized, .workdir = workdir});
        }
        return prepared;
    }

    std::vector<prepared_target> orchestrator::build(const bench_descriptor& bench) {
        try {
            auto prepared = prepare(bench);
            state_ = run_state::idle;
            if (!quiet_) {
                out_ << "bench " << bench.name << " built successfully\n";
            }
            return prepared;
        } catch (...) {
            state_ = run_state::failed;
            throw;
        }
    }

    run_summary orchestrator::bench(const bench_descriptor& bench, const bench_options& options, std::stop_token stop) {
        run_summary summary{};
        try {
            if (bench.targets.empty()) {
                throw config_error(bench.name, "no labels configured");
            }
            auto seed = options.seed ? *options.seed : static_cast<uint64_t>(std::random_device{}());

            // samplers first: a bad range or distribution is a configuration error, found before any build
            std::vector<sampler> samplers{};
            samplers.reserve(bench.targets.size());
            for (size_t i = 0U; i < bench.targets.size(); ++i) {
                try {
                    samplers.emplace_back(options.bounds, bench.sampler, seed + i + 1U, &err_);
                } catch (const std::invalid_argument& e) {
                    throw config_error(bench.name, e.what());
                }
            }

            auto prepared = prepare(bench);

            table_schema schema{.parameter = bench.parameter, .output = bench.output};
            std::vector<measurement_table> tables{};
            tables.reserve(prepared.size());
            for (const auto& p : prepared) {
                tables.push_back(store_.open_or_init(table_id{bench.name, p.target->label}, schema));
            }

            state_ = run_state::sampling;

            std::mt19937_64 chooser{seed};
            std::uniform_int_distribution<size_t> pick{0U, prepared.size() - 1U};
            size_t consecutive_failures = 0U;

            while (!stop.stop_requested()) {
                if (options.iterations && summary.samples >= *options.iterations) {
                    break;
                }

                auto index = pick(chooser);
                const auto& target = *prepared[index].target;
                auto subject = detail::subject_of(bench, target);
                auto parameter = samplers[index].next();

                double metric{};
                try {
                    metric = runner_.run(target.bench_function, parameter, prepared[index].workdir, subject);
                } catch (const bench_failed& e) {
                    ++consecutive_failures;
                    if (cfg_.settings.on_bench_failure == failure_policy::abort ||
                        consecutive_failures >= detail::max_consecutive_failures) {
                        throw;
                    }
                    ++summary.skipped;
                    err_ << "warning: [{}] {}: {} (skipped)\n"_format(e.stage(), e.subject(), e.what());
                    continue;
                }
                consecutive_failures = 0U;

                tables[index].append(static_cast<double>(parameter), metric);
                ++summary.samples;
                ++summary.samples_per_label[target.label];

                if (!quiet_) {
                    out_ << "sampled {}: {} {}={} {}={}\n"_format(
                            summary.samples, target.label, bench.parameter, parameter, bench.output, metric);
                }
            }

            state_ = run_state::stopped;
            summary.state = state_;
            if (!quiet_) {
                out_ << "stopped after {} sample(s); data in {}\n"_format(
                        summary.samples, revisions_.layout().table_dir(bench.name).string());
            }
            return summary;
        } catch (...) {
            state_ = run_state::failed;
            throw;
        }
    }

}  // namespace perftrack
