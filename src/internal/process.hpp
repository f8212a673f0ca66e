#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace perftrack::internal {

    struct process_request {
        std::vector<std::string> args{};
        std::optional<std::filesystem::path> cwd{};
        int timeout_ms{60'000};
        // run the child in its own process group so a terminal interrupt only reaches us
        bool own_process_group{true};
    };

    struct process_result {
        int exit_code{-1};
        bool timed_out{false};
        bool spawn_failed{false};
        std::string stdout_output{};
        std::string stderr_output{};

        bool success() const { return !timed_out && !spawn_failed && exit_code == 0; }
    };

    process_result run_process(const process_request& request);

    std::string describe_command(const std::vector<std::string>& args);

}  // namespace perftrack::internal
