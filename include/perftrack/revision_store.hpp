#pragma once

#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack {

    /*
     * Version control boundary. Implementations must create linked working trees without touching
     * the main working tree, and must be safe to call for different revisions of one repository.
     */
    class version_control {
      public:
        virtual ~version_control() = default;

        // throws revision_unavailable when the checkout cannot be created
        virtual void add_worktree(const std::filesystem::path& path, std::string_view revision) = 0;
        virtual bool is_checkout_of(const std::filesystem::path& path, std::string_view revision) = 0;
        virtual void prune_worktrees() = 0;
    };

    class git_version_control final : public version_control {
        std::filesystem::path repo_root_;
        int timeout_ms_;
        std::ostream* trace_;

      public:
        explicit git_version_control(
                std::filesystem::path repo_root, int timeout_ms = 600'000, std::ostream* trace = nullptr);

        void add_worktree(const std::filesystem::path& path, std::string_view revision) override;
        bool is_checkout_of(const std::filesystem::path& path, std::string_view revision) override;
        void prune_worktrees() override;
    };

    // one build/<benchmark>/<label> link and the directory it resolves to
    struct reference_link {
        std::string benchmark{};
        std::string label{};
        std::filesystem::path link{};
        std::filesystem::path target{};
    };

    using reference_index = std::map<std::filesystem::path, std::vector<reference_link>>;

    class revision_store {
        const configuration& cfg_;
        project_layout layout_;
        version_control& vcs_;
        std::ostream& log_;

        std::filesystem::path lock_path() const;
        std::filesystem::path resolve_target(std::string_view revision) const;
        bool owns(const std::filesystem::path& target) const;
        bool release_unlocked(std::string_view benchmark, std::string_view label);

      public:
        revision_store(const configuration& cfg, project_layout layout, version_control& vcs, std::ostream& log);

        const project_layout& layout() const { return layout_; }

        std::filesystem::path materialized_path(std::string_view revision) const;

        // build/bench working directory beneath the materialized revision
        std::filesystem::path workdir(std::string_view revision) const;

        // idempotent; the sentinel revision resolves to the live checkout
        std::filesystem::path ensure_materialized(std::string_view revision);

        // throws link_conflict if the label already links to another revision
        void retain_reference(std::string_view benchmark, std::string_view label, std::string_view revision);

        // removes the link and, once unreferenced, the materialized directory;
        // returns false when no link existed
        bool release(std::string_view benchmark, std::string_view label);

        // releases every label link of a benchmark; returns the number of links removed
        size_t release_all(std::string_view benchmark);

        reference_index scan_references() const;
    };

}  // namespace perftrack
