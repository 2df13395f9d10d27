#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "http/client/transfer_state.hpp"

using http::client::BodyBuffer;
using http::client::ResponseHeadParser;

namespace {
    void feed_all(ResponseHeadParser& parser, const std::vector<std::string>& lines) {
        for (const auto& line : lines) {
            parser.feed(line);
        }
    }
}  // namespace

TEST(ResponseHeadParserTest, ParsesStatusAndHeaders) {
    ResponseHeadParser parser;

    feed_all(parser, {"HTTP/1.1 404 Not Found\r\n", "Content-Type: text/plain\r\n", "Content-Length: 9\r\n"});
    EXPECT_FALSE(parser.complete());
    parser.feed("\r\n");

    EXPECT_TRUE(parser.complete());
    EXPECT_EQ(parser.status(), 404);
    EXPECT_EQ(parser.status_line(), "HTTP/1.1 404 Not Found");
    EXPECT_EQ(parser.headers(), (std::vector<std::string>{"Content-Type: text/plain", "Content-Length: 9"}));
}

TEST(ResponseHeadParserTest, InterimResponsesAreDiscarded) {
    ResponseHeadParser parser;

    feed_all(parser, {"HTTP/1.1 100 Continue\r\n", "\r\n"});
    EXPECT_FALSE(parser.complete());

    feed_all(parser, {"HTTP/1.1 103 Early Hints\r\n", "Link: </style.css>\r\n", "\r\n"});
    EXPECT_FALSE(parser.complete());
    EXPECT_EQ(parser.status(), 103);

    feed_all(parser, {"HTTP/1.1 201 Created\r\n", "Location: /objects/1\r\n", "\r\n"});
    EXPECT_TRUE(parser.complete());
    EXPECT_EQ(parser.status(), 201);
    EXPECT_EQ(parser.headers(), std::vector<std::string>{"Location: /objects/1"});
}

TEST(ResponseHeadParserTest, FoldedLinesJoinThePreviousHeader) {
    ResponseHeadParser parser;

    feed_all(parser, {"HTTP/1.1 200 OK\r\n", "X-Long: first\r\n", "   second\r\n", "\tthird\r\n", "\r\n"});

    EXPECT_EQ(parser.headers(), std::vector<std::string>{"X-Long: first second third"});
}

TEST(ResponseHeadParserTest, TrailersAfterTheHeadAreIgnored) {
    ResponseHeadParser parser;

    feed_all(parser, {"HTTP/1.1 200 OK\r\n", "Transfer-Encoding: chunked\r\n", "\r\n", "X-Checksum: abc\r\n", "\r\n"});

    EXPECT_TRUE(parser.complete());
    EXPECT_EQ(parser.headers(), std::vector<std::string>{"Transfer-Encoding: chunked"});
}

TEST(ResponseHeadParserTest, HttpTwoStatusLineWithoutReason) {
    ResponseHeadParser parser;

    feed_all(parser, {"HTTP/2 204\r\n", "\r\n"});

    EXPECT_TRUE(parser.complete());
    EXPECT_EQ(parser.status(), 204);
    EXPECT_EQ(parser.status_line(), "HTTP/2 204");
    EXPECT_TRUE(parser.headers().empty());
}

TEST(BodyBufferTest, TakesInChunks) {
    BodyBuffer buffer;
    char out[4] = {};

    ASSERT_TRUE(buffer.append("abcdef", 6));
    EXPECT_EQ(buffer.available(), 6U);

    ASSERT_EQ(buffer.take(out, sizeof(out)), 4U);
    EXPECT_EQ(std::string(out, 4), "abcd");
    ASSERT_EQ(buffer.take(out, sizeof(out)), 2U);
    EXPECT_EQ(std::string(out, 2), "ef");
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.take(out, sizeof(out)), 0U);
}

TEST(BodyBufferTest, RefusesDataOnceTheLimitIsWaiting) {
    BodyBuffer buffer(8);

    ASSERT_TRUE(buffer.append("12345", 5));
    ASSERT_TRUE(buffer.append("6789", 4));
    EXPECT_FALSE(buffer.append("x", 1));
    EXPECT_EQ(buffer.available(), 9U);

    char out[16] = {};
    ASSERT_EQ(buffer.take(out, 2), 2U);
    EXPECT_FALSE(buffer.append("x", 1));
    ASSERT_EQ(buffer.take(out, sizeof(out)), 7U);
    EXPECT_EQ(std::string(out, 7), "3456789");

    EXPECT_TRUE(buffer.append("x", 1));
    ASSERT_EQ(buffer.take(out, sizeof(out)), 1U);
    EXPECT_EQ(out[0], 'x');
}
