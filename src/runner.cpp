#include "perftrack/runner.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include "internal/process.hpp"

#include <cctype>
#include <ostream>

using namespace perftrack::literals;

namespace perftrack {

    namespace detail {

        static bool is_digit(char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        }

        static std::string tail(std::string_view text, size_t limit = 2'000U) {
            text = utils::trim_view(text);
            if (text.size() > limit) {
                text.remove_prefix(text.size() - limit);
            }
            return std::string{text};
        }

    }  // namespace detail

    std::optional<double> extract_metric(std::string_view text) {
        size_t pos = 0U;
        while (pos < text.size()) {
            if (!detail::is_digit(text[pos])) {
                ++pos;
                continue;
            }

            auto start = pos;
            while (pos < text.size() && detail::is_digit(text[pos])) {
                ++pos;
            }
            if (pos + 1U < text.size() && text[pos] == '.' && detail::is_digit(text[pos + 1U])) {
                ++pos;
                while (pos < text.size() && detail::is_digit(text[pos])) {
                    ++pos;
                }
                if (auto value = utils::parse_arithmetic<double>(text.substr(start, pos - start))) {
                    return value;
                }
            }
        }
        return std::nullopt;
    }

    benchmark_runner::benchmark_runner(const tool_settings& settings, std::ostream* trace)
            : command_prefix_{settings.bench_command}, timeout_ms_{settings.bench_timeout_ms}, trace_{trace} {}

    std::vector<std::string> benchmark_runner::command_for(std::string_view entry_point, int64_t parameter) const {
        auto args = command_prefix_;
        args.emplace_back(entry_point);
        args.push_back(std::to_string(parameter));
        return args;
    }

    double benchmark_runner::run(
            std::string_view entry_point,
            int64_t parameter,
            const std::filesystem::path& working_directory,
            std::string_view subject) const {
        auto who = subject.empty() ? std::string{entry_point} : std::string{subject};
        auto args = command_for(entry_point, parameter);

        if (trace_ != nullptr) {
            *trace_ << "+ (cd " << working_directory.string() << " && " << internal::describe_command(args) << ")\n";
        }

        auto proc = internal::run_process({.args = args, .cwd = working_directory, .timeout_ms = timeout_ms_});

        if (proc.spawn_failed) {
            throw bench_failed(who, proc.exit_code, false, proc.stderr_output, "failed to start benchmark");
        }
        if (proc.timed_out) {
            throw bench_failed(
                    who,
                    proc.exit_code,
                    true,
                    proc.stderr_output,
                    "benchmark {} {} timed out after {} ms"_format(entry_point, parameter, timeout_ms_));
        }
        if (proc.exit_code != 0) {
            throw bench_failed(
                    who,
                    proc.exit_code,
                    false,
                    proc.stderr_output,
                    "benchmark {} {} exited with {}: {}"_format(
                            entry_point, parameter, proc.exit_code, detail::tail(proc.stderr_output)));
        }

        auto metric = extract_metric(proc.stdout_output);
        if (!metric) {
            throw output_parse_error(
                    who,
                    proc.stdout_output,
                    proc.stderr_output,
                    "benchmark {} {} printed no decimal number: '{}'"_format(
                            entry_point, parameter, detail::tail(proc.stdout_output, 200U)));
        }
        return *metric;
    }

}  // namespace perftrack
