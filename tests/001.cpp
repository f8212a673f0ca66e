#include "utils.hpp"

namespace perftrack::test {
    using namespace std::string_view_literals;

    TEST_CASE("001: policy and mode parsing", "[001][config]") {
        sample_policy policy = sample_policy::uniform;
        failure_policy on_failure = failure_policy::abort;
        output_mode mode = output_mode::table;

        REQUIRE(try_parse_sample_policy("SKEWED"sv, policy));
        CHECK(policy == sample_policy::skewed);
        CHECK_FALSE(try_parse_sample_policy("gaussian"sv, policy));

        REQUIRE(try_parse_failure_policy("skip"sv, on_failure));
        CHECK(on_failure == failure_policy::skip);
        CHECK_FALSE(try_parse_failure_policy("retry"sv, on_failure));

        REQUIRE(try_parse_output_mode("JSON"sv, mode));
        CHECK(mode == output_mode::json);
        CHECK_FALSE(try_parse_output_mode("yaml"sv, mode));

        CHECK(to_string(sample_policy::uniform) == "uniform"sv);
        CHECK(to_string(failure_policy::abort) == "abort"sv);
        CHECK(to_string(failure_stage::schema) == "schema"sv);
    }

    TEST_CASE("001: configuration parses benchmarks and labels", "[001][config]") {
        auto cfg = parse_configuration(detail::two_label_config);

        CHECK(cfg.schema_version == 1);
        CHECK(cfg.settings.workdir == "cli");
        CHECK(cfg.settings.bench_timeout_ms == 10'000);
        CHECK(cfg.settings.on_bench_failure == failure_policy::abort);
        REQUIRE(cfg.settings.bench_command.size() == 4U);
        CHECK(cfg.settings.bench_command[0] == "/bin/sh");

        REQUIRE(cfg.benches.size() == 1U);
        const auto& bench = cfg.benchmark("matrix-multiply");
        CHECK(bench.parameter == "size");
        CHECK(bench.output == "seconds");
        CHECK(bench.description == "naive matrix multiply");
        CHECK(bench.sampler.policy == sample_policy::uniform);

        REQUIRE(bench.targets.size() == 2U);
        const auto* baseline = bench.find_target("baseline");
        REQUIRE(baseline != nullptr);
        CHECK(baseline->revision == "abc123");
        CHECK(baseline->bench_function == "matmul");
        CHECK_FALSE(baseline->elf);
        CHECK(bench.find_target("missing") == nullptr);
    }

    TEST_CASE("001: settings default to the cargo toolchain", "[001][config]") {
        auto cfg = parse_configuration(R"({
            "benches": {
                "fib": {
                    "parameter": "n",
                    "output": "ms",
                    "sampler": {"policy": "skewed", "mean": 40.0, "sigma": 0.25},
                    "benches": {
                        "head": {"commit": "current", "bench_function": "fib", "elf": "guest"}
                    }
                }
            }
        })");

        CHECK(cfg.settings.workdir == "cli");
        CHECK(cfg.settings.build_command == std::vector<std::string>{"cargo", "build", "--release"});
        CHECK(cfg.settings.bench_command == std::vector<std::string>{"cargo", "run", "--release", "bench"});
        CHECK(cfg.settings.bench_timeout_ms == 600'000);
        CHECK(cfg.settings.tmp_root == default_tmp_root());

        const auto& bench = cfg.benchmark("fib");
        CHECK(bench.sampler.policy == sample_policy::skewed);
        REQUIRE(bench.sampler.mean);
        CHECK(*bench.sampler.mean == 40.0);
        CHECK(bench.sampler.sigma == 0.25);
        REQUIRE(bench.targets.size() == 1U);
        CHECK(bench.targets[0].revision == current_checkout);
        REQUIRE(bench.targets[0].elf);
        CHECK(*bench.targets[0].elf == "guest");
    }

    TEST_CASE("001: invalid configurations are config errors", "[001][config]") {
        auto expect_config_error = [](std::string_view json) {
            try {
                static_cast<void>(parse_configuration(json));
                FAIL("expected config_error");
            } catch (const config_error& e) {
                CHECK(e.stage() == failure_stage::config);
            }
        };

        SECTION("malformed json") {
            expect_config_error(R"({"benches": )");
        }

        SECTION("parameter and output must differ") {
            expect_config_error(R"({"benches": {"b": {"parameter": "n", "output": "n",
                "benches": {"l": {"commit": "abc", "bench_function": "f"}}}}})");
        }

        SECTION("label must be usable as a file name") {
            expect_config_error(R"({"benches": {"b": {"parameter": "n", "output": "t",
                "benches": {"a/b": {"commit": "abc", "bench_function": "f"}}}}})");
        }

        SECTION("unknown sampler policy") {
            expect_config_error(R"({"benches": {"b": {"parameter": "n", "output": "t",
                "sampler": {"policy": "gaussian"},
                "benches": {"l": {"commit": "abc", "bench_function": "f"}}}}})");
        }

        SECTION("newer schema") {
            expect_config_error(R"({"schema_version": 2, "benches": {}})");
        }

        SECTION("empty bench command") {
            expect_config_error(R"({"settings": {"bench_command": []}, "benches": {}})");
        }

        SECTION("absolute elf path") {
            expect_config_error(R"({"benches": {"b": {"parameter": "n", "output": "t",
                "benches": {"l": {"commit": "abc", "bench_function": "f", "elf": "/guest"}}}}})");
        }
    }

    TEST_CASE("001: unknown benchmark lookup names the benchmark", "[001][config]") {
        auto cfg = parse_configuration(detail::two_label_config);
        try {
            static_cast<void>(cfg.benchmark("nope"));
            FAIL("expected config_error");
        } catch (const config_error& e) {
            CHECK(e.subject() == "nope");
        }
    }

    TEST_CASE("001: project layout paths", "[001][config]") {
        project_layout layout{};
        layout.root = "/work";
        layout.tmp_root = "/tmp/revs";

        CHECK(layout.link_path("matrix-multiply", "baseline") == "/work/build/matrix-multiply/baseline");
        CHECK(layout.table_path("matrix-multiply", "baseline") == "/work/data/matrix-multiply/baseline.csv");
        CHECK(layout.report_path("matrix-multiply") == "/work/plots/matrix-multiply.json");
    }

    TEST_CASE("001: load_configuration reports missing files", "[001][config]") {
        detail::temp_dir temp{"perftrack_config_missing"};
        CHECK_THROWS_AS(load_configuration(temp.path / "config.json"), config_error);

        detail::write_file(temp.path / "config.json", detail::two_label_config);
        auto cfg = load_configuration(temp.path / "config.json");
        CHECK(cfg.benches.size() == 1U);
    }
}  // namespace perftrack::test
