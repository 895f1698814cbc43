#include "rolodex/contacts/validation.hpp"
#include "support/contact_fixtures.hpp"

#include <gtest/gtest.h>

using namespace rolodex;
using namespace rolodex::contacts;
using rolodex::test_support::parse_or_throw;
using rolodex::test_support::valid_contact;

namespace {

validation_error_code failure_of(const json::value& body) {
    auto res = check_required_fields(body);
    EXPECT_FALSE(res.has_value());
    return res ? validation_error_code::invalid_field_type : res.error().code;
}

} // namespace

TEST(RequiredFields, ValidBodyPasses) {
    EXPECT_TRUE(check_required_fields(valid_contact()).has_value());
}

TEST(RequiredFields, MissingTopLevelField) {
    for (const char* field : {"fullName", "email", "address", "picture"}) {
        auto body = valid_contact();
        body.set(field, nullptr);
        auto res = check_required_fields(body);
        ASSERT_FALSE(res.has_value()) << field;
        EXPECT_EQ(res.error().code, validation_error_code::missing_required_fields) << field;
        EXPECT_EQ(res.error().message,
                  "Missing required fields: fullName, email, address, picture");
    }
}

TEST(RequiredFields, EmptyStringCountsAsMissing) {
    auto body = valid_contact();
    body.set("email", "");
    EXPECT_EQ(failure_of(body), validation_error_code::missing_required_fields);
}

TEST(RequiredFields, EmptyBody) {
    EXPECT_EQ(failure_of(json::value::make_object()),
              validation_error_code::missing_required_fields);
    EXPECT_EQ(failure_of(json::value::make_array()),
              validation_error_code::missing_required_fields);
}

TEST(RequiredFields, StreetNumberZeroIsInvalidAddress) {
    auto body = valid_contact();
    body.set("address", parse_or_throw(R"({"street": {"number": 0, "name": "Main"}})"));
    auto res = check_required_fields(body);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, validation_error_code::invalid_address);
    EXPECT_EQ(res.error().message,
              "Invalid address structure. Required: address.street.number and "
              "address.street.name");
}

TEST(RequiredFields, AddressWithoutStreet) {
    auto body = valid_contact();
    body.set("address", parse_or_throw(R"({"city": "Paris"})"));
    EXPECT_EQ(failure_of(body), validation_error_code::invalid_address);
}

TEST(RequiredFields, MissingThumbnail) {
    auto body = valid_contact();
    body.set("picture", parse_or_throw(R"({"large": "l", "medium": "m"})"));
    auto res = check_required_fields(body);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, validation_error_code::invalid_picture);
    EXPECT_EQ(res.error().message,
              "Invalid picture structure. Required: picture.large, picture.medium, "
              "picture.thumbnail");
}

TEST(RequiredFields, MissingRegisteredDate) {
    auto body = valid_contact();
    body.set("registeredDate", "");
    auto res = check_required_fields(body);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, validation_error_code::missing_registered_date);
    EXPECT_EQ(res.error().message, "registeredDate is required");
}

TEST(RequiredFields, FirstFailingRuleWins) {
    auto body = valid_contact();
    body.set("picture", parse_or_throw(R"({"large": "l"})"));
    body.set("registeredDate", nullptr);
    body.set("address", parse_or_throw(R"({"street": {"number": 3}})"));
    EXPECT_EQ(failure_of(body), validation_error_code::invalid_address);
}
