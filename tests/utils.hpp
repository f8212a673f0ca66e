#pragma once

#include "perftrack/perftrack.hpp"

#include <catch2/catch_test_macros.hpp>

extern "C" {
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack::test::detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(const std::string& prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    inline std::string read_file(const fs::path& path) {
        std::ifstream in{path};
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline void write_file(const fs::path& path, std::string_view text) {
        fs::create_directories(path.parent_path());
        std::ofstream out{path, std::ios::trunc};
        out << text;
    }

    inline std::vector<std::string> read_lines(const fs::path& path) {
        std::ifstream in{path};
        std::vector<std::string> lines{};
        std::string line{};
        while (std::getline(in, line)) {
            lines.push_back(line);
        }
        return lines;
    }

    // stands in for git: a checkout is a directory with a `.git` file naming its revision
    class fake_version_control final : public version_control {
      public:
        std::map<std::string, int> checkouts{};
        int prunes{0};
        std::vector<std::string> unavailable{};

        void add_worktree(const fs::path& path, std::string_view revision) override {
            for (const auto& missing : unavailable) {
                if (missing == revision) {
                    throw revision_unavailable(std::string{revision}, "unknown revision");
                }
            }
            ++checkouts[std::string{revision}];
            fs::create_directories(path / "cli");
            write_file(path / ".git", revision);
        }

        bool is_checkout_of(const fs::path& path, std::string_view revision) override {
            std::error_code ec{};
            if (!fs::is_regular_file(path / ".git", ec)) {
                return false;
            }
            return read_file(path / ".git") == revision;
        }

        void prune_worktrees() override { ++prunes; }
    };

    // project root, revision root and a configuration parsed from json
    struct sandbox {
        temp_dir temp;
        project_layout layout{};
        configuration config{};

        explicit sandbox(const std::string& prefix, std::string_view json) : temp{prefix} {
            layout.root = temp.path / "project";
            layout.tmp_root = temp.path / "revisions";
            fs::create_directories(layout.root / "cli");
            config = parse_configuration(json, "test");
            config.settings.tmp_root = layout.tmp_root;
        }
    };

    // matrix-multiply over two labels; the benchmark prints "took 0.<param> s"
    inline constexpr auto two_label_config = R"({
        "schema_version": 1,
        "settings": {
            "workdir": "cli",
            "build_command": ["/bin/sh", "-c", "exit 0"],
            "bench_command": ["/bin/sh", "-c", "echo took 0.$2 s", "sh"],
            "bench_timeout_ms": 10000,
            "build_timeout_ms": 10000
        },
        "benches": {
            "matrix-multiply": {
                "parameter": "size",
                "output": "seconds",
                "description": "naive matrix multiply",
                "benches": {
                    "baseline": {"commit": "abc123", "bench_function": "matmul"},
                    "candidate": {"commit": "def456", "bench_function": "matmul"}
                }
            }
        }
    })";

}  // namespace perftrack::test::detail
