#pragma once

#include "config.hpp"
#include "measurement_store.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack {

    struct linear_fit {
        double slope{};
        double intercept{};

        double at(double x) const { return intercept + slope * x; }
    };

    // ordinary least squares; nullopt for no points, a flat line through the mean when x has no spread
    std::optional<linear_fit> fit_least_squares(std::span<const double> x, std::span<const double> y);

    struct report_series {
        std::string label{};
        std::string revision{};
        std::vector<double> parameters{};
        std::vector<double> metrics{};
        std::vector<double> fitted{};
        std::optional<linear_fit> fit{};
        // false for an empty or missing table: present in the report, not drawn
        bool plotted{false};
    };

    struct bench_report {
        std::string benchmark{};
        std::string description{};
        std::string parameter{};
        std::string output{};
        std::vector<report_series> series{};
        size_t total_samples{0};
    };

    class report_assembler {
        const configuration& cfg_;
        const measurement_store& store_;

      public:
        report_assembler(const configuration& cfg, const measurement_store& store);

        bench_report assemble(std::string_view benchmark) const;
    };

    std::string to_json(const bench_report& report);
    void write_report(const bench_report& report, const std::filesystem::path& path);
    void print_report_table(const bench_report& report, std::ostream& os);

}  // namespace perftrack
