#include "rolodex/contacts/contact_store.hpp"

#include <string_view>

namespace rolodex::contacts {

namespace {

constexpr std::string_view SCHEMA_SQL = R"sql(
CREATE TABLE IF NOT EXISTS contacts (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    fullName TEXT NOT NULL,
    email TEXT NOT NULL,
    phone TEXT,
    cell TEXT,
    registeredDate TEXT NOT NULL,
    age INTEGER,
    street_number INTEGER,
    street_name TEXT,
    city TEXT,
    country TEXT,
    picture_large TEXT,
    picture_medium TEXT,
    picture_thumbnail TEXT,
    created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now')),
    updated_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))
)
)sql";

constexpr std::string_view SELECT_ALL_SQL =
    "SELECT id, fullName, email, phone, cell, registeredDate, age, street_number, street_name, "
    "city, country, picture_large, picture_medium, picture_thumbnail, created_at, updated_at "
    "FROM contacts ORDER BY created_at DESC, id DESC";

constexpr std::string_view SELECT_BY_ID_SQL =
    "SELECT id, fullName, email, phone, cell, registeredDate, age, street_number, street_name, "
    "city, country, picture_large, picture_medium, picture_thumbnail, created_at, updated_at "
    "FROM contacts WHERE id = ?";

constexpr std::string_view INSERT_SQL =
    "INSERT INTO contacts (fullName, email, phone, cell, registeredDate, age, street_number, "
    "street_name, city, country, picture_large, picture_medium, picture_thumbnail) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) RETURNING id";

constexpr std::string_view UPDATE_SQL =
    "UPDATE contacts SET fullName = ?, email = ?, phone = ?, cell = ?, registeredDate = ?, "
    "age = ?, street_number = ?, street_name = ?, city = ?, country = ?, picture_large = ?, "
    "picture_medium = ?, picture_thumbnail = ?, "
    "updated_at = strftime('%Y-%m-%dT%H:%M:%fZ', 'now') WHERE id = ? RETURNING id";

constexpr std::string_view DELETE_SQL = "DELETE FROM contacts WHERE id = ? RETURNING id";

constexpr int FIELD_COUNT = 13;

} // namespace

storage::db_result<void> contact_store::init_schema() {
    return db_.execute(std::string(SCHEMA_SQL));
}

storage::db_result<std::vector<contact_row>> contact_store::list_all() {
    auto stmt = db_.prepare(SELECT_ALL_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    std::vector<contact_row> rows;
    while (true) {
        auto step = db_.step(*stmt);
        if (!step) {
            return std::unexpected(step.error());
        }
        if (*step == storage::step_result::done) {
            break;
        }
        rows.push_back(read_row(*stmt));
    }
    return rows;
}

storage::db_result<std::optional<contact_row>> contact_store::find_by_id(int64_t id) {
    auto stmt = db_.prepare(SELECT_BY_ID_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (auto bound = stmt->bind(1, id); !bound) {
        return std::unexpected(bound.error());
    }

    auto step = db_.step(*stmt);
    if (!step) {
        return std::unexpected(step.error());
    }
    if (*step == storage::step_result::done) {
        return std::optional<contact_row>{};
    }
    return std::optional<contact_row>{read_row(*stmt)};
}

storage::db_result<int64_t> contact_store::insert(const contact_row& row) {
    auto stmt = db_.prepare(INSERT_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (auto bound = bind_fields(*stmt, row); !bound) {
        return std::unexpected(bound.error());
    }

    auto step = db_.step(*stmt);
    if (!step) {
        return std::unexpected(step.error());
    }
    if (*step != storage::step_result::row) {
        return std::unexpected(storage::database_error{SQLITE_ERROR, "insert returned no id"});
    }
    int64_t id = stmt->column_int64(0).value_or(0);

    if (auto finished = db_.step(*stmt); !finished) {
        return std::unexpected(finished.error());
    }
    return id;
}

storage::db_result<bool> contact_store::update(int64_t id, const contact_row& row) {
    auto stmt = db_.prepare(UPDATE_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (auto bound = bind_fields(*stmt, row); !bound) {
        return std::unexpected(bound.error());
    }
    if (auto bound = stmt->bind(FIELD_COUNT + 1, id); !bound) {
        return std::unexpected(bound.error());
    }

    auto step = db_.step(*stmt);
    if (!step) {
        return std::unexpected(step.error());
    }
    if (*step == storage::step_result::done) {
        return false;
    }
    if (auto finished = db_.step(*stmt); !finished) {
        return std::unexpected(finished.error());
    }
    return true;
}

storage::db_result<bool> contact_store::remove(int64_t id) {
    auto stmt = db_.prepare(DELETE_SQL);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }
    if (auto bound = stmt->bind(1, id); !bound) {
        return std::unexpected(bound.error());
    }

    auto step = db_.step(*stmt);
    if (!step) {
        return std::unexpected(step.error());
    }
    if (*step == storage::step_result::done) {
        return false;
    }
    if (auto finished = db_.step(*stmt); !finished) {
        return std::unexpected(finished.error());
    }
    return true;
}

storage::db_result<void> contact_store::bind_fields(storage::statement& stmt,
                                                    const contact_row& row) {
    int index = 0;
    storage::db_result<void> bound;
    auto bind_next = [&stmt, &index, &bound](const auto& value) {
        if (bound) {
            bound = stmt.bind(++index, value);
        }
    };

    bind_next(std::string_view(row.full_name));
    bind_next(std::string_view(row.email));
    bind_next(row.phone);
    bind_next(row.cell);
    bind_next(std::string_view(row.registered_date));
    bind_next(row.age);
    bind_next(row.street_number);
    bind_next(std::string_view(row.street_name));
    bind_next(row.city);
    bind_next(row.country);
    bind_next(std::string_view(row.picture_large));
    bind_next(std::string_view(row.picture_medium));
    bind_next(std::string_view(row.picture_thumbnail));
    return bound;
}

contact_row contact_store::read_row(const storage::statement& stmt) {
    contact_row row;
    row.id = stmt.column_int64(0).value_or(0);
    row.full_name = stmt.column_text(1).value_or("");
    row.email = stmt.column_text(2).value_or("");
    row.phone = stmt.column_text(3);
    row.cell = stmt.column_text(4);
    row.registered_date = stmt.column_text(5).value_or("");
    row.age = stmt.column_int64(6);
    row.street_number = stmt.column_int64(7).value_or(0);
    row.street_name = stmt.column_text(8).value_or("");
    row.city = stmt.column_text(9);
    row.country = stmt.column_text(10);
    row.picture_large = stmt.column_text(11).value_or("");
    row.picture_medium = stmt.column_text(12).value_or("");
    row.picture_thumbnail = stmt.column_text(13).value_or("");
    row.created_at = stmt.column_text(14).value_or("");
    row.updated_at = stmt.column_text(15).value_or("");
    return row;
}

} // namespace rolodex::contacts
