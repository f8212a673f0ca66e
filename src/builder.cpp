#include "perftrack/builder.hpp"

#include "internal/process.hpp"

#include <ostream>

namespace perftrack {

    builder::builder(const tool_settings& settings, std::ostream* trace)
            : command_{settings.build_command}, timeout_ms_{settings.build_timeout_ms}, trace_{trace} {}

    build_result builder::build(const std::filesystem::path& path) const {
        build_result result{};
        result.working_directory = path;
        result.command = command_;

        std::error_code ec{};
        if (!std::filesystem::is_directory(path, ec)) {
            result.output = "build directory does not exist: " + path.string();
            return result;
        }

        if (trace_ != nullptr) {
            *trace_ << "+ (cd " << path.string() << " && " << internal::describe_command(command_) << ")\n";
        }

        auto proc = internal::run_process({.args = command_, .cwd = path, .timeout_ms = timeout_ms_});
        result.exit_code = proc.exit_code;
        result.timed_out = proc.timed_out;
        result.success = proc.success();
        result.output = std::move(proc.stdout_output);
        result.output += proc.stderr_output;
        return result;
    }

}  // namespace perftrack
