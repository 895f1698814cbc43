#include "rolodex/core/http.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace rolodex;
using namespace rolodex::http;

TEST(HttpParser, ParseSimpleGetRequest) {
    parser p;

    auto result = p.parse("GET /index.html HTTP/1.1\r\nHost: example.com\r\n\r\n");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);

    const auto& req = p.get_request();
    EXPECT_EQ(req.http_method, method::get);
    EXPECT_EQ(req.uri, "/index.html");
    EXPECT_EQ(req.headers.size(), 1u);
    EXPECT_EQ(req.header("Host").value_or(""), "example.com");
    EXPECT_TRUE(req.body.empty());
    EXPECT_TRUE(req.keep_alive);
}

TEST(HttpParser, ParsePostRequestWithBody) {
    parser p;

    std::string request = "POST /api/data HTTP/1.1\r\n"
                          "Host: api.example.com\r\n"
                          "Content-Type: application/json\r\n"
                          "Content-Length: 13\r\n"
                          "\r\n"
                          "{\"key\":\"val\"}";

    auto result = p.parse(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);

    const auto& req = p.get_request();
    EXPECT_EQ(req.http_method, method::post);
    EXPECT_EQ(req.uri, "/api/data");
    EXPECT_EQ(req.body, "{\"key\":\"val\"}");
    EXPECT_EQ(req.header("content-type").value_or(""), "application/json");
}

TEST(HttpParser, ParseAllMethods) {
    struct test_case {
        std::string method_str;
        method expected_method;
    };

    std::vector<test_case> cases = {
        {"GET", method::get},
        {"POST", method::post},
        {"PUT", method::put},
        {"DELETE", method::del},
        {"PATCH", method::patch},
        {"HEAD", method::head},
        {"OPTIONS", method::options},
        {"BREW", method::unknown},
    };

    for (const auto& tc : cases) {
        parser p;
        auto result = p.parse(tc.method_str + " / HTTP/1.1\r\nHost: example.com\r\n\r\n");
        ASSERT_TRUE(result.has_value()) << tc.method_str;
        EXPECT_EQ(p.get_request().http_method, tc.expected_method) << tc.method_str;
    }
}

TEST(HttpParser, IncrementalFeed) {
    parser p;
    std::string request = "POST /contacts HTTP/1.1\r\n"
                          "Content-Length: 5\r\n"
                          "\r\n"
                          "hello";

    for (size_t i = 0; i + 1 < request.size(); ++i) {
        auto result = p.parse(std::string_view(&request[i], 1));
        ASSERT_TRUE(result.has_value());
        EXPECT_NE(*result, parser::state::complete);
    }
    auto result = p.parse(std::string_view(&request.back(), 1));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);
    EXPECT_EQ(p.get_request().body, "hello");
}

TEST(HttpParser, ChunkedBody) {
    parser p;
    std::string request = "POST /upload HTTP/1.1\r\n"
                          "Transfer-Encoding: chunked\r\n"
                          "\r\n"
                          "5\r\nhello\r\n"
                          "6;ext=1\r\n world\r\n"
                          "0\r\n"
                          "\r\n";

    auto result = p.parse(request);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);
    EXPECT_EQ(p.get_request().body, "hello world");
}

TEST(HttpParser, PipelinedRequests) {
    parser p;
    auto result = p.parse("GET /a HTTP/1.1\r\nHost: x\r\n\r\nGET /b HTTP/1.1\r\nHost: x\r\n\r\n");
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(p.is_complete());
    EXPECT_EQ(p.take_request().uri, "/a");
    EXPECT_TRUE(p.has_buffered_data());

    p.reset();
    result = p.parse({});
    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(p.is_complete());
    EXPECT_EQ(p.take_request().uri, "/b");

    p.reset();
    EXPECT_TRUE(p.is_idle());
}

TEST(HttpParser, ConnectionCloseDisablesKeepAlive) {
    parser p;
    ASSERT_TRUE(p.parse("GET / HTTP/1.1\r\nConnection: close\r\n\r\n").has_value());
    EXPECT_FALSE(p.get_request().keep_alive);
}

TEST(HttpParser, Http10DefaultsToClose) {
    parser p;
    ASSERT_TRUE(p.parse("GET / HTTP/1.0\r\n\r\n").has_value());
    EXPECT_FALSE(p.get_request().keep_alive);

    parser q;
    ASSERT_TRUE(q.parse("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n").has_value());
    EXPECT_TRUE(q.get_request().keep_alive);
}

TEST(HttpParser, RejectsMalformedRequestLine) {
    for (const char* raw : {"GARBAGE\r\n\r\n", "GET /\r\n\r\n", "GET / HTTP/2.0\r\n\r\n",
                            "GET /a b HTTP/1.1\r\n\r\n"}) {
        parser p;
        auto result = p.parse(raw);
        ASSERT_FALSE(result.has_value()) << raw;
        EXPECT_EQ(result.error(), make_error_code(error_code::malformed_request)) << raw;
    }
}

TEST(HttpParser, RejectsMalformedHeaders) {
    parser p;
    auto result = p.parse("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::malformed_request));

    parser q;
    result = q.parse("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::malformed_request));
}

TEST(HttpParser, RejectsOversizedHeaders) {
    parser p;
    std::string request = "GET / HTTP/1.1\r\nX-Big: " + std::string(MAX_HEADER_SIZE, 'a') +
                          "\r\n\r\n";
    auto result = p.parse(request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::header_too_large));
}

TEST(HttpParser, RejectsOversizedBody) {
    parser p;
    auto result = p.parse("POST / HTTP/1.1\r\nContent-Length: " +
                          std::to_string(MAX_BODY_SIZE + 1) + "\r\n\r\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::body_too_large));
}

TEST(HttpParser, RejectsLongUri) {
    parser p;
    auto result = p.parse("GET /" + std::string(MAX_URI_LENGTH + 1, 'a') + " HTTP/1.1\r\n\r\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::uri_too_long));
}

TEST(HttpParser, RejectsUnsupportedTransferEncoding) {
    parser p;
    auto result = p.parse("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::unsupported_encoding));
}

TEST(HttpRequest, PathStripsQueryAndFragment) {
    request req;
    req.uri = "/api/contacts?limit=5#top";
    EXPECT_EQ(req.path(), "/api/contacts");

    req.uri = "/api/health";
    EXPECT_EQ(req.path(), "/api/health");
}

TEST(HttpHeaders, CaseInsensitiveSetAndRemove) {
    headers_map headers;
    headers.set("Content-Type", "text/plain");
    headers.set("content-type", "application/json");
    EXPECT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.get("CONTENT-TYPE").value_or(""), "application/json");

    EXPECT_TRUE(headers.remove("Content-type"));
    EXPECT_FALSE(headers.contains("Content-Type"));
    EXPECT_FALSE(headers.remove("Content-Type"));
}

TEST(HttpResponse, SerializeAddsContentLength) {
    auto res = response::ok("hello", "text/plain");
    EXPECT_EQ(res.serialize(),
              "HTTP/1.1 200 OK\r\n"
              "Content-Type: text/plain\r\n"
              "Content-Length: 5\r\n"
              "\r\n"
              "hello");
}

TEST(HttpResponse, JsonResponse) {
    auto body = json::value::make_object();
    body.set("success", true);
    auto res = response::json(body, 201);

    EXPECT_EQ(res.status, 201);
    EXPECT_EQ(res.reason, "Created");
    EXPECT_EQ(res.headers.get("Content-Type").value_or(""), "application/json");
    EXPECT_EQ(res.body, R"({"success":true})");
}

TEST(HttpResponse, ErrorResponse) {
    auto res = response::error(error_body::not_found("Contact not found"));
    EXPECT_EQ(res.status, 404);
    EXPECT_EQ(res.reason, "Not Found");
    EXPECT_EQ(res.body, R"({"error":"Contact not found"})");
}

TEST(HttpResponse, NoContentHasNoLength) {
    auto wire = response::no_content().serialize();
    EXPECT_EQ(wire, "HTTP/1.1 204 No Content\r\n\r\n");
}

TEST(HttpMethod, RoundTripsNames) {
    for (auto m : {method::get, method::post, method::put, method::del, method::patch,
                   method::head, method::options}) {
        EXPECT_EQ(parse_method(method_to_string(m)), m);
    }
    EXPECT_EQ(method_to_string(method::unknown), "UNKNOWN");
}
