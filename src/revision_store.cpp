#include "perftrack/revision_store.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include "internal/file_lock.hpp"
#include "internal/process.hpp"

#include <algorithm>
#include <ostream>
#include <system_error>

using namespace perftrack::literals;

namespace perftrack {

    namespace detail {

        namespace fs = std::filesystem;

        // absolute, lexically normal, without a trailing separator
        static fs::path normalized(const fs::path& path) {
            std::error_code ec{};
            auto out = fs::absolute(path, ec);
            out = ec ? path.lexically_normal() : out.lexically_normal();
            if (!out.has_filename() && out.has_parent_path() && out != out.root_path()) {
                out = out.parent_path();
            }
            return out;
        }

        static bool same_location(const fs::path& lhs, const fs::path& rhs) {
            return normalized(lhs) == normalized(rhs);
        }

        static std::string trimmed(std::string text) {
            return std::string{utils::trim_view(text)};
        }

        // creates the tmp root and takes the materialization lock; `raise` throws the caller's domain error
        template <typename Raise>
        static internal::file_lock lock_tmp_root(const fs::path& tmp_root, const fs::path& lock_file, Raise&& raise) {
            std::error_code ec{};
            fs::create_directories(tmp_root, ec);
            if (ec) {
                raise("failed to create {}: {}"_format(tmp_root.string(), ec.message()));
            }
            try {
                return internal::file_lock{lock_file};
            } catch (const std::system_error& e) {
                raise(std::string{e.what()});
                throw;
            }
        }

        static void trace(std::ostream* os, const std::vector<std::string>& args) {
            if (os != nullptr) {
                *os << "+ " << internal::describe_command(args) << '\n';
            }
        }

    }  // namespace detail

    // ── git ─────────────────────────────────────────────────────────────

    git_version_control::git_version_control(std::filesystem::path repo_root, int timeout_ms, std::ostream* trace)
            : repo_root_{std::move(repo_root)}, timeout_ms_{timeout_ms}, trace_{trace} {}

    void git_version_control::add_worktree(const std::filesystem::path& path, std::string_view revision) {
        // --detach: a branch checked out elsewhere must not block a second worktree of it
        std::vector<std::string> args{
                "git",
                "-C",
                repo_root_.string(),
                "worktree",
                "add",
                "--force",
                "--detach",
                path.string(),
                std::string{revision}};
        detail::trace(trace_, args);

        auto result = internal::run_process({.args = args, .cwd = std::nullopt, .timeout_ms = timeout_ms_});
        if (!result.success()) {
            throw revision_unavailable(
                    std::string{revision},
                    "git worktree add failed (exit {}): {}"_format(
                            result.exit_code, detail::trimmed(result.stderr_output)));
        }
    }

    bool git_version_control::is_checkout_of(const std::filesystem::path& path, std::string_view revision) {
        std::error_code ec{};
        // linked worktrees carry a .git file pointing back at the main repository
        if (!std::filesystem::is_regular_file(path / ".git", ec)) {
            return false;
        }

        auto head = internal::run_process(
                {.args = {"git", "-C", path.string(), "rev-parse", "HEAD"}, .timeout_ms = timeout_ms_});
        auto wanted = internal::run_process(
                {.args = {"git",
                          "-C",
                          repo_root_.string(),
                          "rev-parse",
                          "--verify",
                          "--quiet",
                          "{}^{{commit}}"_format(revision)},
                 .timeout_ms = timeout_ms_});
        if (!head.success() || !wanted.success()) {
            return false;
        }
        return detail::trimmed(head.stdout_output) == detail::trimmed(wanted.stdout_output);
    }

    void git_version_control::prune_worktrees() {
        std::vector<std::string> args{"git", "-C", repo_root_.string(), "worktree", "prune"};
        detail::trace(trace_, args);
        auto result = internal::run_process({.args = args, .timeout_ms = timeout_ms_});
        if (!result.success()) {
            throw std::runtime_error(
                    "git worktree prune failed (exit {}): {}"_format(
                            result.exit_code, detail::trimmed(result.stderr_output)));
        }
    }

    // ── revision store ──────────────────────────────────────────────────

    revision_store::revision_store(
            const configuration& cfg, project_layout layout, version_control& vcs, std::ostream& log)
            : cfg_{cfg}, layout_{std::move(layout)}, vcs_{vcs}, log_{log} {
        layout_.root = detail::normalized(layout_.root);
        layout_.tmp_root = detail::normalized(layout_.tmp_root.empty() ? cfg_.settings.tmp_root : layout_.tmp_root);
    }

    std::filesystem::path revision_store::lock_path() const {
        return layout_.tmp_root / ".materialize.lock";
    }

    std::filesystem::path revision_store::materialized_path(std::string_view revision) const {
        if (revision == current_checkout) {
            return layout_.root;
        }
        if (!utils::is_path_component(revision)) {
            throw revision_unavailable(std::string{revision}, "revision id is not usable as a directory name");
        }
        return layout_.tmp_root / revision;
    }

    std::filesystem::path revision_store::workdir(std::string_view revision) const {
        return materialized_path(revision) / cfg_.settings.workdir;
    }

    std::filesystem::path revision_store::resolve_target(std::string_view revision) const {
        return materialized_path(revision);
    }

    bool revision_store::owns(const std::filesystem::path& target) const {
        auto normalized = detail::normalized(target);
        return normalized.parent_path() == layout_.tmp_root && normalized != layout_.root;
    }

    std::filesystem::path revision_store::ensure_materialized(std::string_view revision) {
        namespace fs = std::filesystem;

        if (revision == current_checkout) {
            return layout_.root;
        }
        auto path = materialized_path(revision);

        // serializes materialization across processes sharing the tmp root
        auto lock = detail::lock_tmp_root(layout_.tmp_root, lock_path(), [&](const std::string& message) {
            throw revision_unavailable(std::string{revision}, message);
        });

        std::error_code ec{};
        if (fs::exists(path, ec)) {
            if (vcs_.is_checkout_of(path, revision)) {
                debug_log("reusing ", path.string());
                return path;
            }
            if (!fs::is_directory(path, ec) || !fs::is_empty(path, ec)) {
                throw revision_unavailable(
                        std::string{revision},
                        "{} exists but is not a checkout of {}; clean it up first"_format(path.string(), revision));
            }
            fs::remove(path, ec);
        }

        log_ << "materializing " << revision << " at " << path.string() << '\n';
        vcs_.add_worktree(path, revision);

        if (!fs::is_directory(path, ec)) {
            throw revision_unavailable(std::string{revision}, "checkout did not produce {}"_format(path.string()));
        }
        return path;
    }

    void revision_store::retain_reference(
            std::string_view benchmark, std::string_view label, std::string_view revision) {
        namespace fs = std::filesystem;

        auto subject = "{}/{}"_format(benchmark, label);
        auto target = resolve_target(revision);
        auto link = layout_.link_path(benchmark, label);

        std::error_code ec{};
        fs::create_directories(link.parent_path(), ec);
        if (ec) {
            throw link_conflict(
                    subject, {}, "failed to create {}: {}"_format(link.parent_path().string(), ec.message()));
        }

        auto status = fs::symlink_status(link, ec);
        if (fs::is_symlink(status)) {
            auto existing = fs::read_symlink(link, ec);
            if (ec) {
                throw link_conflict(subject, {}, "failed to read link {}: {}"_format(link.string(), ec.message()));
            }
            if (existing.is_relative()) {
                existing = link.parent_path() / existing;
            }
            if (detail::same_location(existing, target)) {
                return;
            }
            throw link_conflict(
                    subject,
                    existing.string(),
                    "{} points to {}, not {}"_format(link.string(), existing.string(), target.string()));
        }
        if (fs::exists(status)) {
            throw link_conflict(subject, link.string(), "{} exists and is not a link"_format(link.string()));
        }

        fs::create_directory_symlink(target, link, ec);
        if (ec) {
            throw link_conflict(subject, {}, "failed to create link {}: {}"_format(link.string(), ec.message()));
        }
    }

    reference_index revision_store::scan_references() const {
        namespace fs = std::filesystem;

        reference_index index{};
        std::error_code ec{};
        if (!fs::is_directory(layout_.build_dir(), ec)) {
            return index;
        }

        // an unreadable link tree must not be mistaken for an unreferenced revision
        auto fail = [](const fs::path& dir, const std::error_code& error) {
            throw link_conflict(
                    dir.filename().string(), {}, "failed to scan {}: {}"_format(dir.string(), error.message()));
        };

        fs::directory_iterator benches{layout_.build_dir(), ec};
        if (ec) {
            fail(layout_.build_dir(), ec);
        }
        for (; benches != fs::directory_iterator{}; benches.increment(ec)) {
            if (ec) {
                fail(layout_.build_dir(), ec);
            }
            const auto& bench_dir = *benches;
            std::error_code inner{};
            if (!bench_dir.is_directory(inner) || bench_dir.is_symlink(inner)) {
                continue;
            }
            fs::directory_iterator entries{bench_dir.path(), inner};
            if (inner) {
                fail(bench_dir.path(), inner);
            }
            for (; entries != fs::directory_iterator{}; entries.increment(inner)) {
                if (inner) {
                    fail(bench_dir.path(), inner);
                }
                const auto& entry = *entries;
                std::error_code link_ec{};
                if (!entry.is_symlink(link_ec)) {
                    continue;
                }
                auto target = fs::read_symlink(entry.path(), link_ec);
                if (link_ec) {
                    fail(entry.path(), link_ec);
                }
                if (target.is_relative()) {
                    target = entry.path().parent_path() / target;
                }
                target = detail::normalized(target);
                index[target].push_back(reference_link{
                        .benchmark = bench_dir.path().filename().string(),
                        .label = entry.path().filename().string(),
                        .link = entry.path(),
                        .target = target});
            }
            if (inner) {
                fail(bench_dir.path(), inner);
            }
        }
        if (ec) {
            fail(layout_.build_dir(), ec);
        }
        return index;
    }

    bool revision_store::release_unlocked(std::string_view benchmark, std::string_view label) {
        namespace fs = std::filesystem;

        auto link = layout_.link_path(benchmark, label);
        std::error_code ec{};
        if (!fs::is_symlink(fs::symlink_status(link, ec))) {
            return false;
        }

        auto target = fs::read_symlink(link, ec);
        if (ec) {
            throw link_conflict(
                    "{}/{}"_format(benchmark, label), {}, "failed to read link {}: {}"_format(link.string(), ec.message()));
        }
        if (target.is_relative()) {
            target = link.parent_path() / target;
        }
        target = detail::normalized(target);

        fs::remove(link, ec);
        if (ec) {
            throw link_conflict(
                    "{}/{}"_format(benchmark, label), {}, "failed to remove link {}: {}"_format(link.string(), ec.message()));
        }

        auto index = scan_references();
        if (index.contains(target)) {
            debug_log(target.string(), " still referenced by ", index[target].size(), " link(s)");
            return true;
        }
        if (!owns(target) || !fs::exists(target, ec)) {
            return true;
        }

        auto removed = fs::remove_all(target, ec);
        if (ec) {
            throw revision_unavailable(
                    target.filename().string(), "failed to delete {}: {}"_format(target.string(), ec.message()));
        }
        log_ << "removed " << target.string() << " (" << removed << " entries)\n";

        try {
            vcs_.prune_worktrees();
        } catch (const std::exception& e) {
            log_ << "warning: " << e.what() << '\n';
        }
        return true;
    }

    bool revision_store::release(std::string_view benchmark, std::string_view label) {
        auto lock = detail::lock_tmp_root(layout_.tmp_root, lock_path(), [&](const std::string& message) {
            throw link_conflict("{}/{}"_format(benchmark, label), {}, message);
        });
        return release_unlocked(benchmark, label);
    }

    size_t revision_store::release_all(std::string_view benchmark) {
        namespace fs = std::filesystem;

        auto dir = layout_.link_dir(benchmark);
        std::error_code ec{};
        if (!fs::is_directory(dir, ec)) {
            return 0U;
        }

        auto lock = detail::lock_tmp_root(layout_.tmp_root, lock_path(), [&](const std::string& message) {
            throw link_conflict(std::string{benchmark}, {}, message);
        });

        std::vector<std::string> labels{};
        fs::directory_iterator it{dir, ec};
        for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
            std::error_code link_ec{};
            if (it->is_symlink(link_ec)) {
                labels.push_back(it->path().filename().string());
            }
        }
        if (ec) {
            throw link_conflict(std::string{benchmark}, {}, "failed to list {}: {}"_format(dir.string(), ec.message()));
        }
        std::ranges::sort(labels);

        size_t released = 0U;
        for (const auto& label : labels) {
            if (release_unlocked(benchmark, label)) {
                ++released;
            }
        }

        if (fs::is_empty(dir, ec)) {
            fs::remove(dir, ec);
        }
        return released;
    }

}  // namespace perftrack
