#pragma once

#include "contact.hpp"
#include "validation.hpp"

#include "rolodex/core/json.hpp"

namespace rolodex::contacts {

/// Reads a request body into a contact. Optional fields may be absent or
/// null; present fields must carry the expected JSON type. Any "id" member is
/// ignored.
validation_result<contact> contact_from_json(const json::value& body);

/// Flattens a contact into its stored form and normalizes registeredDate to
/// YYYY-MM-DDTHH:MM:SS.mmmZ. The id and the server managed columns are left
/// empty.
validation_result<contact_row> to_row(const contact& c);

/// Rebuilds the nested document from a stored row. Never fails: a stored
/// date that does not parse is passed through as text.
contact to_document(const contact_row& row);

json::value to_json(const contact& c);

/// ISO-8601 text of either alternative.
std::string registered_date_text(const registered_date& date);

} // namespace rolodex::contacts
