#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <http/http_response.hpp>

TEST(HttpResponse, MinimalResponse) {
    HttpResponse r("HTTP/1.0 200 OK\r\n\r\n");
    EXPECT_EQ(r.status_code(), 200);
    EXPECT_EQ(r.reason(), "OK");
    EXPECT_EQ(r.text(), "");
    EXPECT_FALSE(r.is_valid_json());
    EXPECT_NO_THROW(r.check_for_success());
}

TEST(HttpResponse, HeadersAndJsonBody) {
    HttpResponse r(
        "HTTP/1.0 201 CREATED\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{\"id\": 7, \"name\": \"box\"}\r\n");

    EXPECT_EQ(r.status_code(), 201);
    EXPECT_EQ(r.reason(), "CREATED");
    EXPECT_EQ(r.headers().at("Content-Type"), "application/json");
    EXPECT_EQ(r.header("content-type").value(), "application/json");
    EXPECT_FALSE(r.header("X-Missing").has_value());

    // Body read in full regardless of Content-Length
    ASSERT_TRUE(r.is_valid_json());
    EXPECT_EQ(r.json()["id"], 7);
    EXPECT_EQ(r.json()["name"], "box");
}

TEST(HttpResponse, AnsiEscapesInHeadersRemoved) {
    HttpResponse r(
        "\x1b[?1h\x1b=HTTP/1.0 200 OK\r\r\n"
        "Server: \x1b[0mWerkzeug\r\r\n"
        "\r\r\n"
        "{\"message\": \"hello\"}");

    EXPECT_EQ(r.status_code(), 200);
    EXPECT_EQ(r.headers().at("Server"), "Werkzeug");
    EXPECT_EQ(r.json()["message"], "hello");
}

TEST(HttpResponse, BareLineFeeds) {
    HttpResponse r("HTTP/1.1 404 NOT FOUND\nX-A: 1\n\nmissing\n");
    EXPECT_EQ(r.status_code(), 404);
    EXPECT_EQ(r.reason(), "NOT FOUND");
    EXPECT_EQ(r.text(), "missing");
    EXPECT_THROW(r.check_for_success(), RestError);
}

TEST(HttpResponse, ContinueBlockSkipped) {
    HttpResponse r(
        "HTTP/1.1 100 Continue\r\n\r\n"
        "HTTP/1.1 200 OK\r\nX-Final: yes\r\n\r\nbody");
    EXPECT_EQ(r.status_code(), 200);
    EXPECT_EQ(r.headers().at("X-Final"), "yes");
    EXPECT_EQ(r.text(), "body");
}

TEST(HttpResponse, FoldedHeaderAndLastValueWins) {
    HttpResponse r(
        "HTTP/1.0 200 OK\r\n"
        "X-Long: first part\r\n"
        "  second part\r\n"
        "X-Dup: one\r\n"
        "X-Dup: two\r\n"
        "\r\n");
    EXPECT_EQ(r.headers().at("X-Long"), "first part second part");
    EXPECT_EQ(r.headers().at("X-Dup"), "two");
}

TEST(HttpResponse, BodyKeepsLeadingWhitespace) {
    HttpResponse r("HTTP/1.0 200 OK\r\n\r\n  indented\r\n\r\n");
    EXPECT_EQ(r.text(), "  indented");
}

TEST(HttpResponse, MalformedStatusLine) {
    EXPECT_THROW(HttpResponse("garbage\r\n\r\n"), RestError);
    EXPECT_THROW(HttpResponse("HTTP/1.0 OK\r\n\r\n"), RestError);
    EXPECT_THROW(HttpResponse(""), RestError);
}

TEST(HttpResponse, InvalidUtf8Body) {
    EXPECT_THROW(HttpResponse("HTTP/1.0 200 OK\r\n\r\n\xff\xfe"), RestError);
}

TEST(HttpResponse, JsonOnTextBodyRaises) {
    HttpResponse r("HTTP/1.0 200 OK\r\n\r\nplain words");
    EXPECT_FALSE(r.is_valid_json());
    try {
        r.json();
        FAIL() << "expected RestError";
    } catch (const RestError& e) {
        EXPECT_NE(std::string(e.what()).find("plain words"), std::string::npos);
    }
}

TEST(HttpResponse, StrPrettyPrintsJson) {
    HttpResponse r("HTTP/1.0 200 OK\r\n\r\n{\"b\": 1, \"a\": [true]}");
    EXPECT_EQ(r.str(),
              "200 OK\n"
              "{\n"
              "    \"a\": [\n"
              "        true\n"
              "    ],\n"
              "    \"b\": 1\n"
              "}");
}

TEST(HttpResponse, StrFallsBackToText) {
    HttpResponse r("HTTP/1.0 500 INTERNAL SERVER ERROR\r\n\r\noops");
    EXPECT_EQ(r.str(), "500 INTERNAL SERVER ERROR\noops");
    try {
        r.check_for_success();
        FAIL() << "expected RestError";
    } catch (const RestError& e) {
        EXPECT_NE(std::string(e.what()).find("500 INTERNAL SERVER ERROR"), std::string::npos);
    }
}

TEST(StripAnsi, RemovesCatalogueSequences) {
    EXPECT_EQ(strip_ansi("\x1b[1mred\x1b[0m"), "red");
    EXPECT_EQ(strip_ansi("\x1b[2J\x1b[12;40Hmoved"), "moved");
    EXPECT_EQ(strip_ansi("a\x1b" "7b\x1b" "8c"), "abc");
    EXPECT_EQ(strip_ansi("no escapes"), "no escapes");
}
