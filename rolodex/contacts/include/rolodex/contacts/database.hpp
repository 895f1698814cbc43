#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace rolodex::storage {

struct database_error {
    int code = SQLITE_ERROR;
    std::string message;
};

template <typename T> using db_result = std::expected<T, database_error>;

/// Thrown only when the database cannot be opened or configured.
class database_exception : public std::runtime_error {
public:
    database_exception(int code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] int code() const noexcept { return code_; }

private:
    int code_;
};

enum class step_result : uint8_t { row, done };

/// Owning prepared statement.
class statement {
public:
    statement() = default;
    explicit statement(sqlite3_stmt* stmt) noexcept : stmt_(stmt) {}

    ~statement() { finalize(); }

    statement(statement&& other) noexcept : stmt_(std::exchange(other.stmt_, nullptr)) {}

    statement& operator=(statement&& other) noexcept {
        if (this != &other) {
            finalize();
            stmt_ = std::exchange(other.stmt_, nullptr);
        }
        return *this;
    }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    // Parameter indexes are 1-based, column indexes 0-based, as in SQLite.
    db_result<void> bind(int index, std::string_view value);
    db_result<void> bind(int index, int64_t value);
    db_result<void> bind(int index, const std::optional<std::string>& value);
    db_result<void> bind(int index, const std::optional<int64_t>& value);
    db_result<void> bind_null(int index);

    [[nodiscard]] std::optional<std::string> column_text(int index) const;
    [[nodiscard]] std::optional<int64_t> column_int64(int index) const;

    [[nodiscard]] sqlite3_stmt* get() const noexcept { return stmt_; }
    [[nodiscard]] explicit operator bool() const noexcept { return stmt_ != nullptr; }

private:
    db_result<void> check_bind(int rc) const;
    void finalize() noexcept;

    sqlite3_stmt* stmt_{nullptr};
};

/// Single shared SQLite connection opened in serialized mode.
///
/// The handle may be used from any worker thread. step() holds the
/// connection mutex while reading the error message so that concurrent
/// statements cannot overwrite it.
class database {
public:
    explicit database(std::string path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    db_result<statement> prepare(std::string_view sql);
    db_result<step_result> step(statement& stmt);
    db_result<void> execute(const std::string& sql);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] sqlite3* handle() const noexcept { return db_; }

private:
    [[nodiscard]] database_error error_from(int rc) const;

    std::string path_;
    sqlite3* db_{nullptr};
};

} // namespace rolodex::storage
