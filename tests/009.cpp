#include "utils.hpp"

#include "internal/types.hpp"

#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <array>

namespace perftrack::test {
    using Catch::Matchers::WithinAbs;

    TEST_CASE("009: least squares recovers an exact line", "[009][report]") {
        std::array<double, 4> x{1.0, 2.0, 3.0, 4.0};
        std::array<double, 4> y{5.0, 7.0, 9.0, 11.0};

        auto fit = fit_least_squares(x, y);
        REQUIRE(fit);
        CHECK_THAT(fit->slope, WithinAbs(2.0, 1e-12));
        CHECK_THAT(fit->intercept, WithinAbs(3.0, 1e-12));
        CHECK_THAT(fit->at(10.0), WithinAbs(23.0, 1e-12));
    }

    TEST_CASE("009: least squares minimizes residuals of noisy data", "[009][report]") {
        std::array<double, 3> x{0.0, 1.0, 2.0};
        std::array<double, 3> y{1.0, 2.0, 4.0};

        auto fit = fit_least_squares(x, y);
        REQUIRE(fit);
        CHECK_THAT(fit->slope, WithinAbs(1.5, 1e-12));
        CHECK_THAT(fit->intercept, WithinAbs(5.0 / 6.0, 1e-12));
    }

    TEST_CASE("009: degenerate inputs", "[009][report]") {
        CHECK_FALSE(fit_least_squares({}, {}));

        std::array<double, 1> one_x{3.0};
        std::array<double, 1> one_y{7.0};
        auto single = fit_least_squares(one_x, one_y);
        REQUIRE(single);
        CHECK(single->slope == 0.0);
        CHECK(single->intercept == 7.0);

        std::array<double, 3> same_x{5.0, 5.0, 5.0};
        std::array<double, 3> spread_y{1.0, 2.0, 6.0};
        auto flat = fit_least_squares(same_x, spread_y);
        REQUIRE(flat);
        CHECK(flat->slope == 0.0);
        CHECK_THAT(flat->intercept, WithinAbs(3.0, 1e-12));
    }

    TEST_CASE("009: report lists every label and skips empty tables", "[009][report]") {
        detail::sandbox box{"perftrack_report", detail::two_label_config};
        detail::write_file(
                box.layout.table_path("matrix-multiply", "baseline"), "size,seconds\n10,0.1\n20,0.3\n30,0.5\n");

        measurement_store store{box.layout};
        report_assembler assembler{box.config, store};
        auto report = assembler.assemble("matrix-multiply");

        CHECK(report.benchmark == "matrix-multiply");
        CHECK(report.parameter == "size");
        CHECK(report.output == "seconds");
        CHECK(report.total_samples == 3U);
        REQUIRE(report.series.size() == 2U);

        const auto& baseline = report.series[0];
        CHECK(baseline.label == "baseline");
        CHECK(baseline.revision == "abc123");
        CHECK(baseline.plotted);
        REQUIRE(baseline.fit);
        CHECK_THAT(baseline.fit->slope, WithinAbs(0.02, 1e-12));
        CHECK_THAT(baseline.fit->intercept, WithinAbs(-0.1, 1e-12));
        REQUIRE(baseline.fitted.size() == 3U);
        CHECK_THAT(baseline.fitted[1], WithinAbs(0.3, 1e-12));

        const auto& candidate = report.series[1];
        CHECK(candidate.label == "candidate");
        CHECK_FALSE(candidate.plotted);
        CHECK_FALSE(candidate.fit);
        CHECK(candidate.parameters.empty());
    }

    TEST_CASE("009: written report is valid json", "[009][report]") {
        detail::sandbox box{"perftrack_report_json", detail::two_label_config};
        detail::write_file(box.layout.table_path("matrix-multiply", "candidate"), "seconds,size\n0.2,10\n0.4,20\n");

        measurement_store store{box.layout};
        auto report = report_assembler{box.config, store}.assemble("matrix-multiply");
        auto path = box.layout.report_path("matrix-multiply");
        write_report(report, path);

        REQUIRE(std::filesystem::exists(path));
        CHECK_FALSE(std::filesystem::exists(path.string() + ".tmp"));

        internal::report_document doc{};
        auto text = detail::read_file(path);
        auto ec = glz::read_json(doc, text);
        REQUIRE_FALSE(ec);
        CHECK(doc.benchmark == "matrix-multiply");
        CHECK(doc.x_label == "size");
        CHECK(doc.y_label == "seconds");
        CHECK(doc.num_samples == 2U);
        REQUIRE(doc.series.size() == 2U);
        CHECK_FALSE(doc.series[0].plotted);
        CHECK(doc.series[1].plotted);
        REQUIRE(doc.series[1].fit);
        CHECK_THAT(doc.series[1].fit->slope, WithinAbs(0.02, 1e-12));
        CHECK(doc.series[1].parameters == std::vector<double>{10.0, 20.0});
    }

    TEST_CASE("009: report table shows fits and placeholders", "[009][report]") {
        detail::sandbox box{"perftrack_report_table", detail::two_label_config};
        detail::write_file(box.layout.table_path("matrix-multiply", "baseline"), "size,seconds\n10,1.0\n20,2.0\n");

        measurement_store store{box.layout};
        auto report = report_assembler{box.config, store}.assemble("matrix-multiply");

        std::ostringstream out{};
        print_report_table(report, out);
        auto text = out.str();
        CHECK(text.starts_with("matrix-multiply: naive matrix multiply\n"));
        CHECK(text.find("num_samples=2") != std::string::npos);
        CHECK(text.find("0.1") != std::string::npos);
        CHECK(text.find("candidate") != std::string::npos);
        CHECK(text.find('-') != std::string::npos);
    }

    TEST_CASE("009: unknown benchmark is a config error", "[009][report]") {
        detail::sandbox box{"perftrack_report_unknown", detail::two_label_config};
        measurement_store store{box.layout};
        report_assembler assembler{box.config, store};
        CHECK_THROWS_AS(assembler.assemble("nope"), config_error);
    }
}  // namespace perftrack::test
