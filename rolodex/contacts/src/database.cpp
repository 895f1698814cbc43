#include "rolodex/contacts/database.hpp"

#include <iostream>

namespace rolodex::storage {

namespace {

class connection_lock {
public:
    explicit connection_lock(sqlite3* db) : mutex_(sqlite3_db_mutex(db)) {
        if (mutex_) {
            sqlite3_mutex_enter(mutex_);
        }
    }
    ~connection_lock() {
        if (mutex_) {
            sqlite3_mutex_leave(mutex_);
        }
    }

    connection_lock(const connection_lock&) = delete;
    connection_lock& operator=(const connection_lock&) = delete;

private:
    sqlite3_mutex* mutex_;
};

} // namespace

db_result<void> statement::bind(int index, std::string_view value) {
    return check_bind(sqlite3_bind_text(
        stmt_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT));
}

db_result<void> statement::bind(int index, int64_t value) {
    return check_bind(sqlite3_bind_int64(stmt_, index, value));
}

db_result<void> statement::bind(int index, const std::optional<std::string>& value) {
    if (!value) {
        return bind_null(index);
    }
    return bind(index, std::string_view(*value));
}

db_result<void> statement::bind(int index, const std::optional<int64_t>& value) {
    if (!value) {
        return bind_null(index);
    }
    return bind(index, *value);
}

db_result<void> statement::bind_null(int index) {
    return check_bind(sqlite3_bind_null(stmt_, index));
}

std::optional<std::string> statement::column_text(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    const auto* text = sqlite3_column_text(stmt_, index);
    int size = sqlite3_column_bytes(stmt_, index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

std::optional<int64_t> statement::column_int64(int index) const {
    if (sqlite3_column_type(stmt_, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, index));
}

db_result<void> statement::check_bind(int rc) const {
    if (rc != SQLITE_OK) {
        return std::unexpected(database_error{rc, sqlite3_errstr(rc)});
    }
    return {};
}

void statement::finalize() noexcept {
    if (stmt_) {
        sqlite3_finalize(stmt_);
        stmt_ = nullptr;
    }
}

database::database(std::string path) : path_(std::move(path)) {
    int rc = sqlite3_open_v2(path_.c_str(),
                             &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw database_exception(rc, "cannot open database '" + path_ + "': " + message);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_extended_result_codes(db_, 1);
    std::cout << "[database] Connected to SQLite database at " << path_ << "\n";
}

database::~database() {
    if (db_) {
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            std::cerr << "[database] Error closing database: " << sqlite3_errstr(rc) << "\n";
        }
        db_ = nullptr;
        std::cout << "[database] Database connection closed.\n";
    }
}

db_result<statement> database::prepare(std::string_view sql) {
    connection_lock lock(db_);
    sqlite3_stmt* raw = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()), &raw, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(raw);
        return std::unexpected(error_from(rc));
    }
    return statement(raw);
}

db_result<step_result> database::step(statement& stmt) {
    connection_lock lock(db_);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return step_result::row;
    }
    if (rc == SQLITE_DONE) {
        return step_result::done;
    }
    return std::unexpected(error_from(rc));
}

db_result<void> database::execute(const std::string& sql) {
    connection_lock lock(db_);
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        database_error error{rc, err ? err : sqlite3_errstr(rc)};
        sqlite3_free(err);
        return std::unexpected(std::move(error));
    }
    return {};
}

database_error database::error_from(int rc) const {
    return database_error{rc, sqlite3_errmsg(db_)};
}

} // namespace rolodex::storage
