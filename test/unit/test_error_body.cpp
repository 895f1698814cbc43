#include "rolodex/core/error_body.hpp"

#include <gtest/gtest.h>

using namespace rolodex;

TEST(ErrorBody, BadRequestWithoutDetails) {
    auto body = error_body::bad_request("Missing required fields");
    EXPECT_EQ(body.status, 400);
    EXPECT_FALSE(body.details.has_value());
    EXPECT_EQ(body.to_json(), R"({"error":"Missing required fields"})");
}

TEST(ErrorBody, BadRequestWithDetails) {
    auto body = error_body::bad_request("Invalid request data", "fullName must be a string");
    EXPECT_EQ(body.to_json(),
              R"({"error":"Invalid request data","details":"fullName must be a string"})");
}

TEST(ErrorBody, ReceivedIsEmittedLast) {
    auto body = error_body::bad_request("Missing required fields");
    auto received = json::value::make_object();
    received.set("email", "a@b.c");
    body.received = received;
    EXPECT_EQ(body.to_json(), R"({"error":"Missing required fields","received":{"email":"a@b.c"}})");
}

TEST(ErrorBody, Defaults) {
    auto missing = error_body::not_found();
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(missing.error, "Route not found");

    auto crashed = error_body::internal_server_error();
    EXPECT_EQ(crashed.status, 500);
    EXPECT_EQ(crashed.to_json(), R"({"error":"Something went wrong!"})");
}
