#include "utils.hpp"

namespace perftrack::test {

    namespace detail {
        struct revision_fixture {
            sandbox box{"perftrack_revisions", two_label_config};
            fake_version_control vcs{};
            std::ostringstream log{};
            revision_store store{box.config, box.layout, vcs, log};
        };
    }  // namespace detail

    TEST_CASE("006: materialization is idempotent", "[006][revisions]") {
        detail::revision_fixture fx{};

        auto first = fx.store.ensure_materialized("abc123");
        auto second = fx.store.ensure_materialized("abc123");
        CHECK(first == second);
        CHECK(first.filename() == "abc123");
        CHECK(fx.vcs.checkouts["abc123"] == 1);
        CHECK(std::filesystem::is_directory(fx.store.workdir("abc123")));
    }

    TEST_CASE("006: the current checkout is never materialized", "[006][revisions]") {
        detail::revision_fixture fx{};

        auto path = fx.store.ensure_materialized(std::string{current_checkout});
        CHECK(path == fx.store.layout().root);
        CHECK(fx.vcs.checkouts.empty());
        CHECK(fx.store.workdir(std::string{current_checkout}) == fx.store.layout().root / "cli");

        fx.store.retain_reference("matrix-multiply", "head", current_checkout);
        CHECK(fx.store.release("matrix-multiply", "head"));
        // the live tree survives release
        CHECK(std::filesystem::is_directory(fx.store.layout().root / "cli"));
    }

    TEST_CASE("006: foreign directory at the revision path is not reused", "[006][revisions]") {
        detail::revision_fixture fx{};
        detail::write_file(fx.box.layout.tmp_root / "abc123" / "notes.txt", "mine");

        try {
            static_cast<void>(fx.store.ensure_materialized("abc123"));
            FAIL("expected revision_unavailable");
        } catch (const revision_unavailable& e) {
            CHECK(e.stage() == failure_stage::materialize);
        }
        CHECK(detail::read_file(fx.box.layout.tmp_root / "abc123" / "notes.txt") == "mine");
    }

    TEST_CASE("006: unknown revisions are unavailable", "[006][revisions]") {
        detail::revision_fixture fx{};
        fx.vcs.unavailable.push_back("badc0de");
        CHECK_THROWS_AS(fx.store.ensure_materialized("badc0de"), revision_unavailable);
        CHECK_THROWS_AS(fx.store.ensure_materialized("../escape"), revision_unavailable);
    }

    TEST_CASE("006: reference links are idempotent and conflicts are refused", "[006][revisions]") {
        detail::revision_fixture fx{};
        auto abc = fx.store.ensure_materialized("abc123");
        static_cast<void>(fx.store.ensure_materialized("def456"));

        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");
        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");

        auto link = fx.store.layout().link_path("matrix-multiply", "baseline");
        REQUIRE(std::filesystem::is_symlink(link));
        CHECK(std::filesystem::read_symlink(link) == abc);

        try {
            fx.store.retain_reference("matrix-multiply", "baseline", "def456");
            FAIL("expected link_conflict");
        } catch (const link_conflict& e) {
            CHECK(e.stage() == failure_stage::link);
            CHECK(e.subject() == "matrix-multiply/baseline");
            CHECK(e.existing_target() == abc.string());
        }
        // the original link is untouched
        CHECK(std::filesystem::read_symlink(link) == abc);
    }

    TEST_CASE("006: release deletes a revision only with its last reference", "[006][revisions]") {
        detail::revision_fixture fx{};
        auto abc = fx.store.ensure_materialized("abc123");

        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");
        fx.store.retain_reference("fib", "baseline", "abc123");

        auto index = fx.store.scan_references();
        REQUIRE(index.contains(abc));
        CHECK(index[abc].size() == 2U);

        CHECK(fx.store.release("matrix-multiply", "baseline"));
        CHECK(std::filesystem::exists(abc));
        CHECK(fx.vcs.prunes == 0);

        CHECK(fx.store.release("fib", "baseline"));
        CHECK_FALSE(std::filesystem::exists(abc));
        CHECK(fx.vcs.prunes == 1);

        // releasing an absent link is a no-op
        CHECK_FALSE(fx.store.release("fib", "baseline"));
    }

    TEST_CASE("006: a released revision is materialized again on demand", "[006][revisions]") {
        detail::revision_fixture fx{};
        static_cast<void>(fx.store.ensure_materialized("abc123"));
        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");
        CHECK(fx.store.release_all("matrix-multiply") == 1U);

        static_cast<void>(fx.store.ensure_materialized("abc123"));
        CHECK(fx.vcs.checkouts["abc123"] == 2);
    }

    TEST_CASE("006: two labels on one revision are deleted exactly once", "[006][revisions]") {
        detail::revision_fixture fx{};
        auto abc = fx.store.ensure_materialized("abc123");
        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");
        fx.store.retain_reference("matrix-multiply", "again", "abc123");
        CHECK(fx.vcs.checkouts["abc123"] == 1);

        CHECK(fx.store.release_all("matrix-multiply") == 2U);
        CHECK_FALSE(std::filesystem::exists(abc));
        CHECK(fx.vcs.prunes == 1);
        CHECK(fx.log.str().find("removed ") != std::string::npos);
    }

    TEST_CASE("006: an unusable revision root fails with revision errors", "[006][revisions]") {
        detail::revision_fixture fx{};
        fx.store.retain_reference("matrix-multiply", "baseline", "abc123");
        detail::write_file(fx.box.temp.path / "blocker", "");

        auto layout = fx.box.layout;
        layout.tmp_root = fx.box.temp.path / "blocker" / "revisions";
        revision_store blocked{fx.box.config, layout, fx.vcs, fx.log};

        CHECK_THROWS_AS(blocked.ensure_materialized("abc123"), revision_unavailable);
        CHECK_THROWS_AS(blocked.release("matrix-multiply", "baseline"), link_conflict);
        CHECK_THROWS_AS(blocked.release_all("matrix-multiply"), link_conflict);
        CHECK(fx.vcs.checkouts.empty());
    }
}  // namespace perftrack::test
