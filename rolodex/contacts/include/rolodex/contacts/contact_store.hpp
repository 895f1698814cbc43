#pragma once

#include "contact.hpp"
#include "database.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace rolodex::contacts {

/// Statements over the contacts table. Every call is one statement.
class contact_store {
public:
    explicit contact_store(storage::database& db) : db_(db) {}

    /// CREATE TABLE IF NOT EXISTS; safe to run on every start.
    storage::db_result<void> init_schema();

    /// Newest first; rows created within the same millisecond by id.
    storage::db_result<std::vector<contact_row>> list_all();
    storage::db_result<std::optional<contact_row>> find_by_id(int64_t id);

    /// Returns the id assigned to the new row.
    storage::db_result<int64_t> insert(const contact_row& row);

    /// false when no row has this id.
    storage::db_result<bool> update(int64_t id, const contact_row& row);
    storage::db_result<bool> remove(int64_t id);

private:
    storage::db_result<void> bind_fields(storage::statement& stmt, const contact_row& row);
    static contact_row read_row(const storage::statement& stmt);

    storage::database& db_;
};

} // namespace rolodex::contacts
