#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace perftrack {

    using namespace std::string_view_literals;

    enum class failure_stage : uint8_t {
        config,
        materialize,
        link,
        build,
        sample,
        append,
        schema,
        report,
    };

    inline constexpr std::string_view to_string(failure_stage stage) {
        switch (stage) {
            case failure_stage::config:
                return "config"sv;
            case failure_stage::materialize:
                return "materialize"sv;
            case failure_stage::link:
                return "link"sv;
            case failure_stage::build:
                return "build"sv;
            case failure_stage::sample:
                return "sample"sv;
            case failure_stage::append:
                return "append"sv;
            case failure_stage::schema:
                return "schema"sv;
            case failure_stage::report:
                return "report"sv;
        }
        return "config"sv;
    }

    // subject names the offending "benchmark/label" pair, or the revision
    class error : public std::runtime_error {
        failure_stage stage_;
        std::string subject_;

      public:
        error(failure_stage stage, std::string subject, const std::string& message)
                : std::runtime_error{message}, stage_{stage}, subject_{std::move(subject)} {}

        failure_stage stage() const noexcept { return stage_; }
        const std::string& subject() const noexcept { return subject_; }
    };

    class config_error : public error {
      public:
        config_error(std::string subject, const std::string& message)
                : error{failure_stage::config, std::move(subject), message} {}
    };

    class revision_unavailable : public error {
      public:
        revision_unavailable(std::string revision, const std::string& message)
                : error{failure_stage::materialize, std::move(revision), message} {}
    };

    class link_conflict : public error {
        std::string existing_target_;

      public:
        link_conflict(std::string subject, std::string existing_target, const std::string& message)
                : error{failure_stage::link, std::move(subject), message},
                  existing_target_{std::move(existing_target)} {}

        const std::string& existing_target() const noexcept { return existing_target_; }
    };

    class build_failed : public error {
        int exit_code_;
        std::string output_;

      public:
        build_failed(std::string subject, int exit_code, std::string output, const std::string& message)
                : error{failure_stage::build, std::move(subject), message},
                  exit_code_{exit_code},
                  output_{std::move(output)} {}

        int exit_code() const noexcept { return exit_code_; }
        const std::string& output() const noexcept { return output_; }
    };

    class bench_failed : public error {
        int exit_code_;
        bool timed_out_;
        std::string stderr_output_;

      public:
        bench_failed(
                std::string subject,
                int exit_code,
                bool timed_out,
                std::string stderr_output,
                const std::string& message)
                : error{failure_stage::sample, std::move(subject), message},
                  exit_code_{exit_code},
                  timed_out_{timed_out},
                  stderr_output_{std::move(stderr_output)} {}

        int exit_code() const noexcept { return exit_code_; }
        bool timed_out() const noexcept { return timed_out_; }
        const std::string& stderr_output() const noexcept { return stderr_output_; }
    };

    // the subprocess succeeded but broke the output contract
    class output_parse_error : public bench_failed {
        std::string stdout_output_;

      public:
        output_parse_error(
                std::string subject, std::string stdout_output, std::string stderr_output, const std::string& message)
                : bench_failed{std::move(subject), 0, false, std::move(stderr_output), message},
                  stdout_output_{std::move(stdout_output)} {}

        const std::string& stdout_output() const noexcept { return stdout_output_; }
    };

    class schema_mismatch : public error {
        std::string expected_;
        std::string found_;

      public:
        schema_mismatch(std::string subject, std::string expected, std::string found, const std::string& message)
                : error{failure_stage::schema, std::move(subject), message},
                  expected_{std::move(expected)},
                  found_{std::move(found)} {}

        const std::string& expected() const noexcept { return expected_; }
        const std::string& found() const noexcept { return found_; }
    };

    // i/o failure on a measurement table; reads report under the report stage
    class store_error : public error {
      public:
        store_error(std::string subject, const std::string& message, failure_stage stage = failure_stage::append)
                : error{stage, std::move(subject), message} {}
    };

}  // namespace perftrack
