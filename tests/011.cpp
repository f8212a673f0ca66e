#include "utils.hpp"

#include "internal/process.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/wait.h>
}

#include <thread>

namespace perftrack::test {

    namespace detail {
        static bool git(const fs::path& repo, std::vector<std::string> args, std::string* out = nullptr) {
            std::vector<std::string> full{"git", "-C", repo.string()};
            full.insert(full.end(), args.begin(), args.end());
            auto result = internal::run_process({.args = std::move(full), .timeout_ms = 30'000});
            if (out != nullptr) {
                *out = std::string{utils::trim_view(result.stdout_output)};
            }
            return result.success();
        }

        // a project root holding one commit; empty `head` when git is not usable here
        struct git_project {
            sandbox box{"perftrack_git", two_label_config};
            std::string head{};

            git_project() {
                auto root = box.layout.root;
                if (!git(root, {"init", "-q"}) ||
                    !git(root,
                         {"-c",
                          "user.name=perftrack",
                          "-c",
                          "user.email=perftrack@localhost",
                          "-c",
                          "commit.gpgsign=false",
                          "commit",
                          "-q",
                          "--allow-empty",
                          "-m",
                          "init"}) ||
                    !git(root, {"rev-parse", "HEAD"}, &head)) {
                    head.clear();
                }
            }
        };

        // checkouts are slow and leave a line in a shared log, so overlapping ones are visible
        class slow_version_control final : public version_control {
            fs::path log_;

          public:
            explicit slow_version_control(fs::path log) : log_{std::move(log)} {}

            void add_worktree(const fs::path& path, std::string_view revision) override {
                auto fd = ::open(log_.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
                if (fd >= 0) {
                    auto line = std::string{revision} + "\n";
                    static_cast<void>(::write(fd, line.data(), line.size()));
                    ::close(fd);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds{200});
                fs::create_directories(path);
                write_file(path / ".git", revision);
            }

            bool is_checkout_of(const fs::path& path, std::string_view revision) override {
                std::error_code ec{};
                return fs::is_regular_file(path / ".git", ec) && read_file(path / ".git") == revision;
            }

            void prune_worktrees() override {}
        };
    }  // namespace detail

    TEST_CASE("011: git worktrees are created, reused and pruned", "[011][git]") {
        detail::git_project project{};
        if (project.head.empty()) {
            SKIP("git is not available");
        }
        git_version_control vcs{project.box.layout.root, 30'000};
        std::ostringstream log{};
        revision_store store{project.box.config, project.box.layout, vcs, log};

        auto path = store.ensure_materialized(project.head);
        CHECK(path == project.box.layout.tmp_root / project.head);
        CHECK(std::filesystem::is_directory(path));
        CHECK(vcs.is_checkout_of(path, project.head));
        CHECK_FALSE(vcs.is_checkout_of(project.box.layout.root / "cli", project.head));
        CHECK_FALSE(vcs.is_checkout_of(path, "0000000000000000000000000000000000000000"));

        // a second request reuses the checkout
        log.str("");
        CHECK(store.ensure_materialized(project.head) == path);
        CHECK(log.str().find("materializing") == std::string::npos);

        store.retain_reference("matrix-multiply", "baseline", project.head);
        CHECK(store.release("matrix-multiply", "baseline"));
        CHECK_FALSE(std::filesystem::exists(path));

        std::string worktrees{};
        REQUIRE(detail::git(project.box.layout.root, {"worktree", "list", "--porcelain"}, &worktrees));
        CHECK(worktrees.find(path.string()) == std::string::npos);
    }

    TEST_CASE("011: unknown git revisions are unavailable", "[011][git]") {
        detail::git_project project{};
        if (project.head.empty()) {
            SKIP("git is not available");
        }
        git_version_control vcs{project.box.layout.root, 30'000};
        std::ostringstream log{};
        revision_store store{project.box.config, project.box.layout, vcs, log};

        try {
            static_cast<void>(store.ensure_materialized("feedfacefeedfacefeedfacefeedfacefeedface"));
            FAIL("expected revision_unavailable");
        } catch (const revision_unavailable& e) {
            CHECK(e.stage() == failure_stage::materialize);
        }
    }

    TEST_CASE("011: racing processes materialize a revision once", "[011][revisions]") {
        detail::sandbox box{"perftrack_race", detail::two_label_config};
        auto checkout_log = box.temp.path / "checkouts.log";

        std::vector<pid_t> racers{};
        for (int i = 0; i < 2; ++i) {
            auto pid = ::fork();
            REQUIRE(pid >= 0);
            if (pid == 0) {
                try {
                    detail::slow_version_control vcs{checkout_log};
                    std::ostringstream log{};
                    revision_store store{box.config, box.layout, vcs, log};
                    static_cast<void>(store.ensure_materialized("abc123"));
                } catch (const std::exception&) {
                    ::_exit(1);
                }
                ::_exit(0);
            }
            racers.push_back(pid);
        }
        for (auto pid : racers) {
            int status = 0;
            REQUIRE(::waitpid(pid, &status, 0) == pid);
            CHECK(WIFEXITED(status));
            CHECK(WEXITSTATUS(status) == 0);
        }

        CHECK(detail::read_lines(checkout_log) == std::vector<std::string>{"abc123"});
        CHECK(detail::read_file(box.layout.tmp_root / "abc123" / ".git") == "abc123");
    }
}  // namespace perftrack::test
