#include "perftrack/report.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include "internal/types.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <ostream>

using namespace perftrack::literals;

namespace perftrack {

    std::optional<linear_fit> fit_least_squares(std::span<const double> x, std::span<const double> y) {
        auto n = std::min(x.size(), y.size());
        if (n == 0U) {
            return std::nullopt;
        }

        double mean_x = 0.0;
        double mean_y = 0.0;
        for (size_t i = 0U; i < n; ++i) {
            mean_x += x[i];
            mean_y += y[i];
        }
        mean_x /= static_cast<double>(n);
        mean_y /= static_cast<double>(n);

        double sxx = 0.0;
        double sxy = 0.0;
        for (size_t i = 0U; i < n; ++i) {
            auto dx = x[i] - mean_x;
            sxx += dx * dx;
            sxy += dx * (y[i] - mean_y);
        }

        if (sxx == 0.0) {
            return linear_fit{.slope = 0.0, .intercept = mean_y};
        }
        auto slope = sxy / sxx;
        return linear_fit{.slope = slope, .intercept = mean_y - slope * mean_x};
    }

    report_assembler::report_assembler(const configuration& cfg, const measurement_store& store)
            : cfg_{cfg}, store_{store} {}

    bench_report report_assembler::assemble(std::string_view benchmark) const {
        const auto& bench = cfg_.benchmark(benchmark);

        bench_report report{};
        report.benchmark = bench.name;
        report.description = bench.description;
        report.parameter = bench.parameter;
        report.output = bench.output;

        table_schema schema{.parameter = bench.parameter, .output = bench.output};
        for (const auto& target : bench.targets) {
            report_series series{};
            series.label = target.label;
            series.revision = target.revision;

            auto rows = store_.read(table_id{bench.name, target.label}, schema);
            series.parameters.reserve(rows.size());
            series.metrics.reserve(rows.size());
            for (const auto& row : rows) {
                series.parameters.push_back(row.parameter);
                series.metrics.push_back(row.metric);
            }

            series.fit = fit_least_squares(series.parameters, series.metrics);
            if (series.fit) {
                series.fitted.reserve(series.parameters.size());
                for (auto x : series.parameters) {
                    series.fitted.push_back(series.fit->at(x));
                }
            }
            series.plotted = !rows.empty();
            report.total_samples += rows.size();
            report.series.push_back(std::move(series));
        }
        return report;
    }

    std::string to_json(const bench_report& report) {
        internal::report_document doc{};
        doc.benchmark = report.benchmark;
        doc.description = report.description;
        doc.x_label = report.parameter;
        doc.y_label = report.output;
        doc.num_samples = report.total_samples;
        for (const auto& series : report.series) {
            internal::series_document s{};
            s.label = series.label;
            s.revision = series.revision;
            s.plotted = series.plotted;
            s.samples = series.parameters.size();
            if (series.fit) {
                s.fit = internal::fit_document{.slope = series.fit->slope, .intercept = series.fit->intercept};
            }
            s.parameters = series.parameters;
            s.metrics = series.metrics;
            s.fitted = series.fitted;
            doc.series.push_back(std::move(s));
        }

        std::string json{};
        auto ec = glz::write_json(doc, json);
        if (ec) {
            throw error(failure_stage::report, report.benchmark, "failed to serialize report");
        }
        return json;
    }

    void write_report(const bench_report& report, const std::filesystem::path& path) {
        auto json = to_json(report);

        std::error_code ec{};
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw error(
                    failure_stage::report,
                    report.benchmark,
                    "failed to create {}: {}"_format(path.parent_path().string(), ec.message()));
        }

        // write-then-rename so a renderer polling the file never sees half a report
        auto staging = path;
        staging += ".tmp";
        {
            std::ofstream out{staging, std::ios::trunc};
            if (!out) {
                throw error(failure_stage::report, report.benchmark, "failed to open {}"_format(staging.string()));
            }
            out << json << '\n';
            if (!out) {
                throw error(failure_stage::report, report.benchmark, "failed to write {}"_format(staging.string()));
            }
        }
        std::filesystem::rename(staging, path, ec);
        if (ec) {
            throw error(
                    failure_stage::report,
                    report.benchmark,
                    "failed to move report into {}: {}"_format(path.string(), ec.message()));
        }
    }

    void print_report_table(const bench_report& report, std::ostream& os) {
        os << report.benchmark;
        if (!report.description.empty()) {
            os << ": " << report.description;
        }
        os << "\nnum_samples=" << report.total_samples << "  (" << report.output << " vs " << report.parameter
           << ")\n";

        os << std::left << std::setw(20) << "label" << std::setw(14) << "revision" << std::right << std::setw(9)
           << "samples" << std::setw(16) << "slope" << std::setw(16) << "intercept" << '\n';

        for (const auto& series : report.series) {
            auto revision = series.revision.size() > 12U ? series.revision.substr(0U, 12U) : series.revision;
            os << std::left << std::setw(20) << series.label << std::setw(14) << revision << std::right
               << std::setw(9) << series.parameters.size();
            if (series.plotted && series.fit) {
                os << std::setw(16) << "{:.6g}"_format(series.fit->slope) << std::setw(16)
                   << "{:.6g}"_format(series.fit->intercept);
            }
            else {
                os << std::setw(16) << "-" << std::setw(16) << "-";
            }
            os << '\n';
        }
    }

}  // namespace perftrack
