#pragma once

#include "config.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stop_token>
#include <string>

namespace perftrack::cli {

    enum class command_kind : uint8_t { none, build, bench, clean, cleancsv, plot };

    inline constexpr std::string_view to_string(command_kind kind) {
        switch (kind) {
            case command_kind::none:
                return "none"sv;
            case command_kind::build:
                return "build"sv;
            case command_kind::bench:
                return "bench"sv;
            case command_kind::clean:
                return "clean"sv;
            case command_kind::cleancsv:
                return "cleancsv"sv;
            case command_kind::plot:
                return "plot"sv;
        }
        return "none"sv;
    }

    struct command_request {
        command_kind kind{command_kind::none};
        std::string benchmark{};
        int64_t min_value{0};
        int64_t max_value{0};
        std::optional<size_t> iterations{};
        std::optional<uint64_t> seed{};
    };

    // returns an exit code when parsing already decided the outcome (help, version, errors)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request);

    // runs one command; domain errors are reported on `err` and mapped to a non-zero exit code
    int run_command(
            const startup_config& cfg,
            const command_request& request,
            std::stop_token stop,
            std::ostream& out,
            std::ostream& err);

}  // namespace perftrack::cli
