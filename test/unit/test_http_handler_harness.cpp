#include "support/http_handler_harness.hpp"

#include <gtest/gtest.h>

using rolodex::http::method;
using rolodex::http::response;
using rolodex::test_support::HttpHandlerHarness;

TEST(HttpHandlerHarness, ParsesRawRequestAndCallsHandler) {
    HttpHandlerHarness harness([](const rolodex::http::request& req) {
        EXPECT_EQ(req.http_method, method::post);
        EXPECT_EQ(req.uri, "/echo");
        EXPECT_EQ(req.header("Content-Type").value_or(""), "application/json");
        EXPECT_EQ(req.body, R"({"ping":"pong"})");
        auto resp = response::ok("ok", "text/plain");
        resp.set_header("X-Handled", "true");
        return resp;
    });

    std::string raw = "POST /echo HTTP/1.1\r\n"
                      "Host: localhost\r\n"
                      "Content-Type: application/json\r\n"
                      "Content-Length: 15\r\n"
                      "\r\n"
                      R"({"ping":"pong"})";

    auto resp = harness.run_raw(raw);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.headers.get("X-Handled").value_or(""), "true");
    EXPECT_EQ(resp.body, "ok");
}

TEST(HttpHandlerHarness, RunsOnExistingRequest) {
    rolodex::http::request req;
    req.http_method = method::get;
    req.uri = "/ping";
    req.headers.set("X-Test", "yes");

    HttpHandlerHarness harness([](const rolodex::http::request& r) {
        EXPECT_EQ(r.header("X-Test").value_or(""), "yes");
        return response::ok("pong");
    });

    auto resp = harness.run(req);
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "pong");
}

TEST(HttpHandlerHarness, SendBuildsContentLength) {
    HttpHandlerHarness harness([](const rolodex::http::request& r) {
        EXPECT_EQ(r.header("Content-Length").value_or(""), "7");
        EXPECT_EQ(r.body, R"({"a":1})");
        return response::ok();
    });

    auto resp = harness.send("PUT", "/x", R"({"a":1})");
    EXPECT_EQ(resp.status, 200);
}

TEST(HttpHandlerHarness, ThrowsOnIncompleteRequest) {
    HttpHandlerHarness harness([](const rolodex::http::request&) { return response::ok(); });
    EXPECT_THROW(harness.run_raw("GET / HTTP/1.1\r\nHost: x\r\n"), std::runtime_error);
}
