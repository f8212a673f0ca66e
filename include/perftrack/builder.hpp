#pragma once

#include "config.hpp"

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

namespace perftrack {

    struct build_result {
        bool success{false};
        int exit_code{-1};
        bool timed_out{false};
        std::filesystem::path working_directory{};
        std::vector<std::string> command{};
        // stdout followed by stderr of the toolchain
        std::string output{};
    };

    class builder {
        std::vector<std::string> command_;
        int timeout_ms_;
        std::ostream* trace_;

      public:
        explicit builder(const tool_settings& settings, std::ostream* trace = nullptr);

        // runs the release build with `path` as working directory; does not cache
        build_result build(const std::filesystem::path& path) const;
    };

}  // namespace perftrack
