#include "perftrack/config.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include "internal/types.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <string>

using namespace perftrack::literals;

namespace perftrack {

    namespace detail {

        namespace fs = std::filesystem;

        static std::string read_text_file(const fs::path& path) {
            std::ifstream in{path};
            if (!in) {
                throw config_error(path.string(), "failed to open {}"_format(path.string()));
            }
            std::ostringstream ss{};
            ss << in.rdbuf();
            if (!in.good() && !in.eof()) {
                throw config_error(path.string(), "failed to read {}"_format(path.string()));
            }
            return ss.str();
        }

        static tool_settings convert_settings(const std::optional<internal::settings_document>& doc,
                                              std::string_view origin) {
            tool_settings settings{};
            settings.tmp_root = default_tmp_root();
            if (!doc) {
                return settings;
            }

            if (doc->tmp_root && !doc->tmp_root->empty()) {
                settings.tmp_root = *doc->tmp_root;
            }
            settings.workdir = doc->workdir;
            settings.build_command = doc->build_command;
            settings.bench_command = doc->bench_command;
            settings.bench_timeout_ms = doc->bench_timeout_ms;
            settings.build_timeout_ms = doc->build_timeout_ms;

            if (settings.build_command.empty() || settings.build_command.front().empty()) {
                throw config_error(std::string{origin}, "settings.build_command must not be empty");
            }
            if (settings.bench_command.empty() || settings.bench_command.front().empty()) {
                throw config_error(std::string{origin}, "settings.bench_command must not be empty");
            }
            if (settings.bench_timeout_ms <= 0 || settings.build_timeout_ms <= 0) {
                throw config_error(std::string{origin}, "settings timeouts must be positive");
            }
            if (settings.workdir.is_absolute()) {
                throw config_error(
                        std::string{origin}, "settings.workdir must be relative: {}"_format(settings.workdir.string()));
            }
            if (!try_parse_failure_policy(doc->on_bench_failure, settings.on_bench_failure)) {
                throw config_error(
                        std::string{origin},
                        "invalid settings.on_bench_failure: {} (expected abort|skip)"_format(doc->on_bench_failure));
            }
            return settings;
        }

        static sampler_settings convert_sampler(
                const std::optional<internal::sampler_document>& doc, const std::string& bench_name) {
            sampler_settings out{};
            if (!doc) {
                return out;
            }
            if (!try_parse_sample_policy(doc->policy, out.policy)) {
                throw config_error(
                        bench_name, "invalid sampler.policy: {} (expected uniform|skewed)"_format(doc->policy));
            }
            out.mean = doc->mean;
            out.sigma = doc->sigma;
            out.max_retries = doc->max_retries;
            if (!(out.sigma > 0.0)) {
                throw config_error(bench_name, "sampler.sigma must be positive");
            }
            if (out.max_retries <= 0) {
                throw config_error(bench_name, "sampler.max_retries must be positive");
            }
            if (out.mean && !(*out.mean > 0.0)) {
                throw config_error(bench_name, "sampler.mean must be positive");
            }
            return out;
        }

        static bench_descriptor convert_bench(const std::string& name, const internal::bench_document& doc) {
            if (!utils::is_path_component(name)) {
                throw config_error(name, "benchmark name is not usable as a directory name");
            }

            bench_descriptor bench{};
            bench.name = name;
            bench.parameter = std::string{utils::trim_view(doc.parameter)};
            bench.output = std::string{utils::trim_view(doc.output)};
            bench.description = doc.description;
            bench.sampler = convert_sampler(doc.sampler, name);

            if (bench.parameter.empty() || bench.output.empty()) {
                throw config_error(name, "parameter and output names must be non-empty");
            }
            if (bench.parameter == bench.output) {
                throw config_error(name, "parameter and output names must differ: {}"_format(bench.parameter));
            }
            if (bench.parameter.find(',') != std::string::npos || bench.output.find(',') != std::string::npos) {
                throw config_error(name, "column names must not contain ','");
            }
            if (doc.benches.empty()) {
                throw config_error(name, "no labels configured under benches");
            }

            for (const auto& [label, target] : doc.benches) {
                auto subject = "{}/{}"_format(name, label);
                if (!utils::is_path_component(label)) {
                    throw config_error(subject, "label is not usable as a file name");
                }
                if (target.commit.empty()) {
                    throw config_error(subject, "commit must be non-empty");
                }
                if (target.commit != current_checkout && !utils::is_path_component(target.commit)) {
                    throw config_error(subject, "commit is not usable as a directory name: {}"_format(target.commit));
                }
                if (target.bench_function.empty()) {
                    throw config_error(subject, "bench_function must be non-empty");
                }

                bench_target out{};
                out.label = label;
                out.revision = target.commit;
                out.bench_function = target.bench_function;
                if (target.elf && !target.elf->empty()) {
                    out.elf = std::filesystem::path{*target.elf};
                    if (out.elf->is_absolute()) {
                        throw config_error(subject, "elf must be relative to the revision root");
                    }
                }
                bench.targets.push_back(std::move(out));
            }
            return bench;
        }

    }  // namespace detail

    const bench_target* bench_descriptor::find_target(std::string_view label) const {
        auto it = std::ranges::find(targets, label, &bench_target::label);
        return it == targets.end() ? nullptr : &*it;
    }

    const bench_descriptor& configuration::benchmark(std::string_view name) const {
        auto it = std::ranges::find(benches, name, &bench_descriptor::name);
        if (it == benches.end()) {
            throw config_error(std::string{name}, "benchmark not found in configuration");
        }
        return *it;
    }

    std::filesystem::path default_tmp_root() {
        std::error_code ec{};
        auto base = std::filesystem::temp_directory_path(ec);
        if (ec) {
            base = "/tmp";
        }
        return base / "perftrack_revisions";
    }

    configuration parse_configuration(std::string_view json, std::string_view origin) {
        internal::config_document doc{};
        auto buffer = std::string{json};
        auto ec = glz::read_json(doc, buffer);
        if (ec) {
            throw config_error(
                    std::string{origin}, "failed to parse configuration: {}"_format(glz::format_error(ec, buffer)));
        }

        if (doc.schema_version > supported_schema_version) {
            throw config_error(
                    std::string{origin},
                    "unsupported schema_version: {} > {}"_format(doc.schema_version, supported_schema_version));
        }

        configuration cfg{};
        cfg.schema_version = doc.schema_version;
        cfg.settings = detail::convert_settings(doc.settings, origin);
        cfg.benches.reserve(doc.benches.size());
        for (const auto& [name, bench] : doc.benches) {
            cfg.benches.push_back(detail::convert_bench(name, bench));
        }

        debug_log("loaded ", cfg.benches.size(), " benchmark(s) from ", origin);
        return cfg;
    }

    configuration load_configuration(const std::filesystem::path& path) {
        auto text = detail::read_text_file(path);
        return parse_configuration(text, path.string());
    }

}  // namespace perftrack
