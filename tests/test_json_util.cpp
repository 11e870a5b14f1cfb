// ---------------------------------------------------------------------------
// test_json_util.cpp
//
// json_escape / find_string_field 단위 테스트.
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <gtest/gtest.h>

#include <string>

// ---------------------------------------------------------------------------
// json_escape
// ---------------------------------------------------------------------------
TEST(JsonEscape, EscapesQuotesBackslashAndControls) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape(R"(a"b)"), R"(a\"b)");
    EXPECT_EQ(json_escape(R"(a\b)"), R"(a\\b)");
    EXPECT_EQ(json_escape("line\nbreak\ttab"), R"(line\nbreak\ttab)");
    EXPECT_EQ(json_escape(std::string{"\x01"}), R"(\u0001)");
}

TEST(JsonEscape, LeavesUtf8Untouched) {
    EXPECT_EQ(json_escape("https://example.com/한글"), "https://example.com/한글");
}

// ---------------------------------------------------------------------------
// find_string_field: 정상
// ---------------------------------------------------------------------------
TEST(FindStringField, ExtractsTopLevelString) {
    auto r = find_string_field(R"({"url":"https://example.com"})", "url");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ(**r, "https://example.com");
}

TEST(FindStringField, ToleratesWhitespaceAndOtherFields) {
    auto r = find_string_field(
        " {\n  \"note\": {\"nested\": [1, 2.5e3, true, null]},\n  \"url\" : \"https://a.example.com\"\n} ",
        "url");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ(**r, "https://a.example.com");
}

TEST(FindStringField, UnescapesEscapes) {
    auto r = find_string_field(R"({"url":"https:\/\/example.com\/a?b=\"c\"&d=\u00e9"})", "url");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ(**r, "https://example.com/a?b=\"c\"&d=\xC3\xA9");
}

TEST(FindStringField, DecodesSurrogatePair) {
    auto r = find_string_field(R"({"url":"\ud83d\ude00"})", "url");
    ASSERT_TRUE(r.has_value());
    ASSERT_TRUE(r->has_value());
    EXPECT_EQ(**r, "\xF0\x9F\x98\x80");
}

TEST(FindStringField, MissingKeyIsNullopt) {
    auto r = find_string_field(R"({"link":"https://example.com"})", "url");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_value());

    auto empty = find_string_field("{}", "url");
    ASSERT_TRUE(empty.has_value());
    EXPECT_FALSE(empty->has_value());
}

TEST(FindStringField, NestedKeyIsNotTopLevel) {
    auto r = find_string_field(R"({"data":{"url":"https://example.com"}})", "url");
    ASSERT_TRUE(r.has_value());
    EXPECT_FALSE(r->has_value());
}

// ---------------------------------------------------------------------------
// find_string_field: 오류
// ---------------------------------------------------------------------------
TEST(FindStringField, RejectsNonObjectBody) {
    for (const char* body : {"", "   ", "[]", R"("url")", "42", "null"}) {
        auto r = find_string_field(body, "url");
        EXPECT_FALSE(r.has_value()) << "body: " << body;
    }
    EXPECT_EQ(find_string_field("[]", "url").error(), "body must be a JSON object");
}

TEST(FindStringField, RejectsNonStringValue) {
    auto r = find_string_field(R"({"url":123})", "url");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "field 'url' must be a string");

    EXPECT_FALSE(find_string_field(R"({"url":null})", "url").has_value());
    EXPECT_FALSE(find_string_field(R"({"url":["x"]})", "url").has_value());
}

TEST(FindStringField, RejectsMalformedJson) {
    const char* bodies[] = {
        R"({"url":"https://example.com")",
        R"({"url" "https://example.com"})",
        R"({"url":"https://example.com",})",
        R"({url:"https://example.com"})",
        R"({"url":"bad \q escape"})",
        R"({"a":tru,"url":"x"})",
        "{\"url\":\"raw\nnewline\"}",
    };
    for (const char* body : bodies) {
        EXPECT_FALSE(find_string_field(body, "url").has_value()) << "body: " << body;
    }
}

TEST(FindStringField, RejectsTrailingGarbage) {
    auto r = find_string_field(R"({"url":"https://example.com"} x)", "url");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error(), "trailing characters after JSON object");
}
