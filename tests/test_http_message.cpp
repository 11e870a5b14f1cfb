// ---------------------------------------------------------------------------
// test_http_message.cpp
//
// parse_request_head / content_length / serialize_response 단위 테스트.
// ---------------------------------------------------------------------------

#include "http/http_message.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <string>

// ---------------------------------------------------------------------------
// parse_request_head: 정상
// ---------------------------------------------------------------------------
TEST(ParseRequestHead, ParsesRequestLineAndHeaders) {
    auto req = parse_request_head(
        "POST /api/shorten HTTP/1.1\r\n"
        "Host: localhost:5000\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 27\r\n"
        "\r\n");
    ASSERT_TRUE(req.has_value()) << req.error().message;
    EXPECT_EQ(req->method, "POST");
    EXPECT_EQ(req->target, "/api/shorten");
    EXPECT_EQ(req->path, "/api/shorten");
    EXPECT_EQ(req->version, "HTTP/1.1");
    EXPECT_EQ(req->header("host"), "localhost:5000");
    EXPECT_EQ(req->header("content-type"), "application/json");
    EXPECT_EQ(req->header("content-length"), "27");
    EXPECT_TRUE(req->header("x-missing").empty());
}

TEST(ParseRequestHead, PathExcludesQueryString) {
    auto req = parse_request_head("GET /api/stats/Ab3Xy9?verbose=1 HTTP/1.0\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->target, "/api/stats/Ab3Xy9?verbose=1");
    EXPECT_EQ(req->path, "/api/stats/Ab3Xy9");
    EXPECT_EQ(req->version, "HTTP/1.0");
}

TEST(ParseRequestHead, HeaderNamesAreLowercasedAndValuesTrimmed) {
    auto req = parse_request_head("GET / HTTP/1.1\r\nX-Forwarded-For: \t 10.0.0.1  \r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->header("x-forwarded-for"), "10.0.0.1");
}

TEST(ParseRequestHead, DuplicateHeadersAreJoined) {
    auto req = parse_request_head("GET / HTTP/1.1\r\nAccept: a\r\naccept: b\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->header("accept"), "a, b");
}

TEST(ParseRequestHead, IdenticalContentLengthRepeatIsAccepted) {
    auto req = parse_request_head(
        "POST /api/shorten HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 5\r\n\r\n");
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->header("content-length"), "5");
}

// ---------------------------------------------------------------------------
// parse_request_head: 오류
// ---------------------------------------------------------------------------
TEST(ParseRequestHead, RejectsMalformedRequestLines) {
    const char* heads[] = {
        "",
        "\r\n\r\n",
        "GET\r\n\r\n",
        "GET /\r\n\r\n",
        "GET / HTTP/1.1 extra\r\n\r\n",
        "get / HTTP/1.1\r\n\r\n",
        "GET example.com HTTP/1.1\r\n\r\n",
        "GET / HTTP/2.0\r\n\r\n",
    };
    for (const char* head : heads) {
        auto req = parse_request_head(head);
        ASSERT_FALSE(req.has_value()) << "head: " << head;
        EXPECT_EQ(req.error().status, 400);
    }
}

TEST(ParseRequestHead, RejectsMalformedHeaders) {
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nNoColon\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\n: empty\r\n\r\n").has_value());
    EXPECT_FALSE(parse_request_head("GET / HTTP/1.1\r\nBad Name: x\r\n\r\n").has_value());
}

TEST(ParseRequestHead, RejectsConflictingContentLength) {
    auto req = parse_request_head(
        "POST /api/shorten HTTP/1.1\r\nContent-Length: 5\r\nContent-Length: 6\r\n\r\n");
    ASSERT_FALSE(req.has_value());
    EXPECT_EQ(req.error().status, 400);
}

// ---------------------------------------------------------------------------
// content_length
// ---------------------------------------------------------------------------
TEST(ContentLength, MissingHeaderIsZero) {
    HttpRequest req;
    auto len = content_length(req, 1024);
    ASSERT_TRUE(len.has_value());
    EXPECT_EQ(*len, 0U);
}

TEST(ContentLength, ParsesWithinLimit) {
    HttpRequest req;
    req.headers["content-length"] = "1024";
    auto len = content_length(req, 1024);
    ASSERT_TRUE(len.has_value());
    EXPECT_EQ(*len, 1024U);
}

TEST(ContentLength, OverLimitIs413) {
    HttpRequest req;
    req.headers["content-length"] = "1025";
    auto len = content_length(req, 1024);
    ASSERT_FALSE(len.has_value());
    EXPECT_EQ(len.error().status, 413);

    req.headers["content-length"] = "99999999999999999999999999";
    len = content_length(req, 1024);
    ASSERT_FALSE(len.has_value());
    EXPECT_EQ(len.error().status, 413);
}

TEST(ContentLength, NonNumericIs400) {
    HttpRequest req;
    for (const char* value : {"abc", "-1", "12x", "+5"}) {
        req.headers["content-length"] = value;
        auto len = content_length(req, std::numeric_limits<std::size_t>::max());
        ASSERT_FALSE(len.has_value()) << value;
        EXPECT_EQ(len.error().status, 400) << value;
    }
}

TEST(ContentLength, TransferEncodingIsNotImplemented) {
    HttpRequest req;
    req.headers["transfer-encoding"] = "chunked";
    auto len = content_length(req, 1024);
    ASSERT_FALSE(len.has_value());
    EXPECT_EQ(len.error().status, 501);
}

// ---------------------------------------------------------------------------
// 응답 직렬화
// ---------------------------------------------------------------------------
TEST(SerializeResponse, WritesStatusHeadersAndBody) {
    auto resp = make_json_response(201, R"({"short_code":"Ab3Xy9"})");
    const auto wire = serialize_response(resp);

    EXPECT_EQ(wire,
              "HTTP/1.1 201 Created\r\n"
              "Content-Type: application/json\r\n"
              "Content-Length: 23\r\n"
              "Connection: close\r\n"
              "\r\n"
              R"({"short_code":"Ab3Xy9"})");
}

TEST(SerializeResponse, RedirectWithoutBody) {
    HttpResponse resp;
    resp.status = 302;
    resp.headers.emplace_back("Location", "https://example.com/page");

    const auto wire = serialize_response(resp);
    EXPECT_TRUE(wire.starts_with("HTTP/1.1 302 Found\r\n"));
    EXPECT_NE(wire.find("Location: https://example.com/page\r\n"), std::string::npos);
    EXPECT_TRUE(wire.ends_with("Content-Length: 0\r\nConnection: close\r\n\r\n"));
}

TEST(ReasonPhrase, KnownAndUnknownCodes) {
    EXPECT_EQ(reason_phrase(404), "Not Found");
    EXPECT_EQ(reason_phrase(405), "Method Not Allowed");
    EXPECT_EQ(reason_phrase(503), "Service Unavailable");
    EXPECT_EQ(reason_phrase(299), "Unknown");
}
