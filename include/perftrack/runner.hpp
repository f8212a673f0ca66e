#pragma once

#include "config.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack {

    // first "<digits>.<digits>" token in the text, the benchmark output contract
    std::optional<double> extract_metric(std::string_view text);

    class benchmark_runner {
        std::vector<std::string> command_prefix_;
        int timeout_ms_;
        std::ostream* trace_;

      public:
        explicit benchmark_runner(const tool_settings& settings, std::ostream* trace = nullptr);

        std::vector<std::string> command_for(std::string_view entry_point, int64_t parameter) const;

        /*
         * Runs one benchmark invocation in `working_directory` and returns the parsed metric. Only stdout
         * carries the metric; stderr is kept for the error paths.
         *
         * throws output_parse_error when no metric is printed, bench_failed on non-zero exit or timeout
         */
        double run(std::string_view entry_point,
                   int64_t parameter,
                   const std::filesystem::path& working_directory,
                   std::string_view subject = {}) const;
    };

}  // namespace perftrack
