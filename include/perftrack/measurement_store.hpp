#pragma once

#include "config.hpp"

#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace perftrack {

    struct table_id {
        std::string benchmark{};
        std::string label{};

        std::string to_string() const { return benchmark + "/" + label; }
    };

    // the two column names of a measurement table; order is written but not significant
    struct table_schema {
        std::string parameter{};
        std::string output{};

        std::string header() const { return parameter + "," + output; }
    };

    struct measurement {
        double parameter{};
        double metric{};
    };

    /*
     * Append handle for one table. Holds the file open in append mode for its whole lifetime; rows are
     * written with a single write and flushed before `append` returns, so the file always ends on a
     * complete row.
     */
    class measurement_table {
        table_id id_;
        table_schema schema_;
        std::filesystem::path path_;
        int fd_{-1};
        bool parameter_first_{true};
        size_t appended_{0};

      public:
        measurement_table(
                table_id id, table_schema schema, std::filesystem::path path, int fd, bool parameter_first);
        measurement_table(measurement_table&& other) noexcept;
        measurement_table& operator=(measurement_table&& other) noexcept;
        measurement_table(const measurement_table&) = delete;
        measurement_table& operator=(const measurement_table&) = delete;
        ~measurement_table();

        // throws store_error; a failed append leaves no partial row behind
        void append(double parameter, double metric);

        const table_id& id() const { return id_; }
        const table_schema& schema() const { return schema_; }
        const std::filesystem::path& path() const { return path_; }
        size_t appended() const { return appended_; }
    };

    class measurement_store {
        project_layout layout_;
        std::ostream* warnings_;

      public:
        explicit measurement_store(project_layout layout, std::ostream* warnings = nullptr);

        std::filesystem::path path_for(const table_id& id) const;
        bool exists(const table_id& id) const;

        // creates the table with a header, or validates the existing header's column set;
        // throws schema_mismatch without writing anything on a conflict
        measurement_table open_or_init(const table_id& id, const table_schema& schema);

        // rows in append order; a missing table reads as empty
        std::vector<measurement> read(const table_id& id, const table_schema& schema) const;

        // deletes data/<benchmark>/; returns the number of files removed
        size_t remove_benchmark(std::string_view benchmark);
    };

}  // namespace perftrack
