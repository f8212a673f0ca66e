#include "perftrack/measurement_store.hpp"

#include "perftrack/errors.hpp"
#include "perftrack/format.hpp"

#include "internal/file_lock.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
}

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <ostream>
#include <system_error>
#include <utility>

using namespace perftrack::literals;

namespace perftrack {

    namespace detail {

        namespace fs = std::filesystem;

        static constexpr size_t max_header_bytes = 64U * 1024U;

        static std::string errno_text() {
            return std::strerror(errno);
        }

        static std::vector<std::string> split_columns(std::string_view line) {
            std::vector<std::string> out{};
            size_t begin = 0U;
            for (;;) {
                auto comma = line.find(',', begin);
                auto cell = line.substr(begin, comma == std::string_view::npos ? line.size() - begin : comma - begin);
                out.emplace_back(utils::trim_view(cell));
                if (comma == std::string_view::npos) {
                    break;
                }
                begin = comma + 1U;
            }
            return out;
        }

        // column *set* comparison; order is not significant
        static bool same_columns(const std::vector<std::string>& found, const table_schema& schema) {
            if (found.size() != 2U) {
                return false;
            }
            return (found[0] == schema.parameter && found[1] == schema.output) ||
                   (found[0] == schema.output && found[1] == schema.parameter);
        }

        static bool write_all(int fd, std::string_view data) {
            while (!data.empty()) {
                auto n = ::write(fd, data.data(), data.size());
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return false;
                }
                data.remove_prefix(static_cast<size_t>(n));
            }
            return true;
        }

        // reads up to the first newline; nullopt when the file holds no complete first line
        static std::optional<std::string> read_first_line(int fd) {
            std::string buf{};
            std::array<char, 4096> chunk{};
            off_t offset = 0;
            while (buf.size() < max_header_bytes) {
                auto n = ::pread(fd, chunk.data(), chunk.size(), offset);
                if (n < 0) {
                    if (errno == EINTR) {
                        continue;
                    }
                    return std::nullopt;
                }
                if (n == 0) {
                    return std::nullopt;
                }
                auto view = std::string_view{chunk.data(), static_cast<size_t>(n)};
                if (auto nl = view.find('\n'); nl != std::string_view::npos) {
                    buf.append(view.substr(0U, nl));
                    if (!buf.empty() && buf.back() == '\r') {
                        buf.pop_back();
                    }
                    return buf;
                }
                buf.append(view);
                offset += n;
            }
            return std::nullopt;
        }

        // offset just past the last newline, scanning backwards from `size`
        static off_t last_line_end(int fd, off_t size) {
            std::array<char, 4096> chunk{};
            auto end = size;
            while (end > 0) {
                auto begin = std::max<off_t>(0, end - static_cast<off_t>(chunk.size()));
                auto want = static_cast<size_t>(end - begin);
                auto n = ::pread(fd, chunk.data(), want, begin);
                if (n <= 0) {
                    return -1;
                }
                for (auto i = static_cast<off_t>(n) - 1; i >= 0; --i) {
                    if (chunk[static_cast<size_t>(i)] == '\n') {
                        return begin + i + 1;
                    }
                }
                end = begin;
            }
            return 0;
        }

    }  // namespace detail

    // ── table handle ────────────────────────────────────────────────────

    measurement_table::measurement_table(
            table_id id, table_schema schema, std::filesystem::path path, int fd, bool parameter_first)
            : id_{std::move(id)},
              schema_{std::move(schema)},
              path_{std::move(path)},
              fd_{fd},
              parameter_first_{parameter_first} {}

    measurement_table::measurement_table(measurement_table&& other) noexcept
            : id_{std::move(other.id_)},
              schema_{std::move(other.schema_)},
              path_{std::move(other.path_)},
              fd_{std::exchange(other.fd_, -1)},
              parameter_first_{other.parameter_first_},
              appended_{other.appended_} {}

    measurement_table& measurement_table::operator=(measurement_table&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) {
                ::close(fd_);
            }
            id_ = std::move(other.id_);
            schema_ = std::move(other.schema_);
            path_ = std::move(other.path_);
            fd_ = std::exchange(other.fd_, -1);
            parameter_first_ = other.parameter_first_;
            appended_ = other.appended_;
        }
        return *this;
    }

    measurement_table::~measurement_table() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    void measurement_table::append(double parameter, double metric) {
        if (fd_ < 0) {
            throw store_error(id_.to_string(), "table is not open");
        }

        auto row = parameter_first_ ? "{},{}\n"_format(parameter, metric) : "{},{}\n"_format(metric, parameter);

        // appenders serialize on the table lock; the rollback below truncates only this row
        std::optional<internal::file_lock> lock{};
        try {
            lock.emplace(fd_);
        } catch (const std::system_error& e) {
            throw store_error(id_.to_string(), "failed to lock {}: {}"_format(path_.string(), e.what()));
        }

        struct stat st{};
        if (::fstat(fd_, &st) != 0) {
            throw store_error(id_.to_string(), "failed to stat {}: {}"_format(path_.string(), detail::errno_text()));
        }

        if (!detail::write_all(fd_, row) || ::fsync(fd_) != 0) {
            auto reason = detail::errno_text();
            // all-or-nothing: drop whatever part of the row reached the file
            if (::ftruncate(fd_, st.st_size) != 0) {
                reason += "; rollback failed: " + detail::errno_text();
            }
            throw store_error(id_.to_string(), "failed to append to {}: {}"_format(path_.string(), reason));
        }
        ++appended_;
    }

    // ── store ───────────────────────────────────────────────────────────

    measurement_store::measurement_store(project_layout layout, std::ostream* warnings)
            : layout_{std::move(layout)}, warnings_{warnings} {}

    std::filesystem::path measurement_store::path_for(const table_id& id) const {
        return layout_.table_path(id.benchmark, id.label);
    }

    bool measurement_store::exists(const table_id& id) const {
        std::error_code ec{};
        return std::filesystem::exists(path_for(id), ec);
    }

    measurement_table measurement_store::open_or_init(const table_id& id, const table_schema& schema) {
        namespace fs = std::filesystem;

        auto subject = id.to_string();
        if (schema.parameter.empty() || schema.output.empty() || schema.parameter == schema.output) {
            throw schema_mismatch(subject, schema.header(), {}, "schema needs two distinct column names");
        }

        auto path = path_for(id);
        std::error_code ec{};
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw store_error(subject, "failed to create {}: {}"_format(path.parent_path().string(), ec.message()));
        }

        int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw store_error(subject, "failed to open {}: {}"_format(path.string(), detail::errno_text()));
        }

        auto fail = [&](auto&& exception) {
            ::close(fd);
            throw std::forward<decltype(exception)>(exception);
        };

        bool parameter_first = true;
        {
            // another process may be initializing the same table
            std::optional<internal::file_lock> lock{};
            try {
                lock.emplace(fd);
            } catch (const std::system_error& e) {
                fail(store_error(subject, "failed to lock {}: {}"_format(path.string(), e.what())));
            }

            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                fail(store_error(subject, "failed to stat {}: {}"_format(path.string(), detail::errno_text())));
            }

            if (st.st_size == 0) {
                if (!detail::write_all(fd, schema.header() + "\n") || ::fsync(fd) != 0) {
                    auto reason = detail::errno_text();
                    if (::ftruncate(fd, 0) != 0) {
                        reason += "; rollback failed";
                    }
                    fail(store_error(subject, "failed to write header to {}: {}"_format(path.string(), reason)));
                }
                debug_log("initialized ", path.string());
            }
            else {
                auto header = detail::read_first_line(fd);
                if (!header) {
                    fail(schema_mismatch(
                            subject, schema.header(), {}, "{} has no complete header line"_format(path.string())));
                }
                auto columns = detail::split_columns(*header);
                if (!detail::same_columns(columns, schema)) {
                    fail(schema_mismatch(
                            subject,
                            schema.header(),
                            *header,
                            "{} has columns '{}', expected '{}'"_format(path.string(), *header, schema.header())));
                }
                parameter_first = columns[0] == schema.parameter;

                // a row without its newline would fuse with the next append
                auto end = detail::last_line_end(fd, st.st_size);
                if (end < 0) {
                    fail(store_error(subject, "failed to read {}: {}"_format(path.string(), detail::errno_text())));
                }
                if (end != st.st_size) {
                    if (::ftruncate(fd, end) != 0) {
                        fail(store_error(
                                subject, "failed to drop partial row in {}: {}"_format(path.string(), detail::errno_text())));
                    }
                    if (warnings_ != nullptr) {
                        *warnings_ << "warning: dropped {} byte(s) of a partial trailing row in {}\n"_format(
                                st.st_size - end, path.string());
                    }
                }
            }
        }

        return measurement_table{id, schema, path, fd, parameter_first};
    }

    std::vector<measurement> measurement_store::read(const table_id& id, const table_schema& schema) const {
        auto subject = id.to_string();
        auto path = path_for(id);

        std::vector<measurement> rows{};
        std::ifstream in{path};
        if (!in) {
            if (!exists(id)) {
                return rows;
            }
            throw store_error(subject, "failed to open {}"_format(path.string()), failure_stage::report);
        }

        std::string line{};
        if (!std::getline(in, line)) {
            return rows;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto columns = detail::split_columns(line);
        if (!detail::same_columns(columns, schema)) {
            throw schema_mismatch(
                    subject,
                    schema.header(),
                    line,
                    "{} has columns '{}', expected '{}'"_format(path.string(), line, schema.header()));
        }
        bool parameter_first = columns[0] == schema.parameter;

        size_t line_no = 1U;
        while (std::getline(in, line)) {
            ++line_no;
            auto view = utils::trim_view(line);
            if (view.empty()) {
                continue;
            }
            auto cells = detail::split_columns(view);
            std::optional<double> first{};
            std::optional<double> second{};
            if (cells.size() == 2U) {
                first = utils::parse_arithmetic<double>(cells[0]);
                second = utils::parse_arithmetic<double>(cells[1]);
            }
            if (!first || !second) {
                // a torn final row from an interrupted foreign writer is not data
                if (in.eof()) {
                    break;
                }
                throw store_error(
                        subject,
                        "malformed row {} in {}: '{}'"_format(line_no, path.string(), line),
                        failure_stage::report);
            }
            rows.push_back(
                    parameter_first ? measurement{.parameter = *first, .metric = *second}
                                    : measurement{.parameter = *second, .metric = *first});
        }
        return rows;
    }

    size_t measurement_store::remove_benchmark(std::string_view benchmark) {
        namespace fs = std::filesystem;

        auto subject = std::string{benchmark};
        if (!utils::is_path_component(benchmark)) {
            throw store_error(subject, "benchmark name is not a plain directory name", failure_stage::config);
        }

        auto dir = layout_.table_dir(benchmark);
        std::error_code ec{};
        if (!fs::is_directory(fs::symlink_status(dir, ec))) {
            return 0U;
        }

        std::vector<fs::path> tables{};
        fs::directory_iterator it{dir, ec};
        for (; !ec && it != fs::directory_iterator{}; it.increment(ec)) {
            std::error_code entry_ec{};
            if (it->is_regular_file(entry_ec) && !it->is_symlink(entry_ec) && it->path().extension() == ".csv") {
                tables.push_back(it->path());
            }
        }
        if (ec) {
            throw store_error(subject, "failed to list {}: {}"_format(dir.string(), ec.message()));
        }

        size_t removed = 0U;
        for (const auto& table : tables) {
            if (!fs::remove(table, ec) && ec) {
                throw store_error(subject, "failed to remove {}: {}"_format(table.string(), ec.message()));
            }
            ++removed;
        }

        // foreign files keep the directory alive
        if (fs::is_empty(dir, ec)) {
            fs::remove(dir, ec);
            if (ec) {
                throw store_error(subject, "failed to remove {}: {}"_format(dir.string(), ec.message()));
            }
        }
        return removed;
    }

}  // namespace perftrack
