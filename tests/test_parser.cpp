#include <gtest/gtest.h>
#include <stdexcept>
#include "../src/Parser.hpp"

class ParserTest : public ::testing::Test {
protected:
    Parser parser;
};

TEST_F(ParserTest, ParsesRequestWithRepeatedHeaders) {
    std::string raw =
        "GET http://example.com/resource HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Cache-Control: max-age=10\r\n"
        "Cache-Control: no-transform\r\n"
        "If-None-Match: \"abc\"\r\n"
        "\r\n";
    Request request = parser.parseRequest(raw);

    EXPECT_EQ(request.getMethod(), "GET");
    EXPECT_EQ(request.getUrl(), "http://example.com/resource");
    EXPECT_EQ(request.getVersion(), "HTTP/1.1");
    EXPECT_EQ(request.getHeaders("cache-control"), (std::vector<std::string>{"max-age=10", "no-transform"}));
    EXPECT_EQ(request.getHeader("If-None-Match"), "\"abc\"");
    EXPECT_FALSE(request.hasBody());
}

TEST_F(ParserTest, ParsesResponseWithContentLength) {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Date: Tue, 14 Nov 2023 22:13:20 GMT\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";
    Response response = parser.parseResponse(raw);

    EXPECT_EQ(response.getVersion(), "HTTP/1.1");
    EXPECT_EQ(response.getResult(), 200);
    EXPECT_EQ(response.getReason(), "OK");
    EXPECT_TRUE(response.hasBody());
    EXPECT_EQ(response.getHeader("Date"), "Tue, 14 Nov 2023 22:13:20 GMT");
    EXPECT_EQ(response.getBody(), "hello");
}

TEST_F(ParserTest, BodyWithoutFramingEndsWithInput) {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "hello";
    EXPECT_EQ(parser.parseResponse(raw).getBody(), "hello");
}

TEST_F(ParserTest, ParsesChunkedBody) {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "3\r\nhel\r\n"
        "2\r\nlo\r\n"
        "0\r\n\r\n";
    Response response = parser.parseResponse(raw);
    EXPECT_EQ(response.getBody(), "hello");
    EXPECT_TRUE(response.hasHeader("Transfer-Encoding"));
}

TEST_F(ParserTest, NotModifiedHasNoBody) {
    std::string raw =
        "HTTP/1.1 304 Not Modified\r\n"
        "ETag: \"abc\"\r\n"
        "\r\n";
    Response response = parser.parseResponse(raw);
    EXPECT_EQ(response.getResult(), 304);
    EXPECT_FALSE(response.hasBody());
}

TEST_F(ParserTest, TruncatedMessageThrows) {
    std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Length: 10\r\n"
        "\r\n"
        "hello";
    EXPECT_THROW(parser.parseResponse(raw), std::runtime_error);
    EXPECT_THROW(parser.parseRequest("GET / HTTP/1.1\r\nHost: exa"), std::runtime_error);
}

TEST_F(ParserTest, EmptyOrGarbageInputThrows) {
    EXPECT_THROW(parser.parseRequest(""), std::runtime_error);
    EXPECT_THROW(parser.parseResponse(""), std::runtime_error);
    EXPECT_THROW(parser.parseResponse("this is not http\r\n\r\n"), std::runtime_error);
}
