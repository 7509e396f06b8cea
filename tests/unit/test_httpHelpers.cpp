#include <gtest/gtest.h>
#include "util/httpHelpers.hpp"
#include "http/types.hpp"

using namespace cn::util;

TEST(HttpHelpersTest, ParseHeaderBlockLowercasesNames) {
    const auto h = parseHeaderBlock("HTTP/1.1 200 OK\r\nETag: \"abc\"\r\nContent-Length: 0\r\n\r\n");
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h.at("etag"), "\"abc\"");
    EXPECT_EQ(h.at("content-length"), "0");
}

TEST(HttpHelpersTest, ParseHeaderBlockLastOccurrenceWins) {
    const auto h = parseHeaderBlock("HTTP/1.1 301 Moved\r\nLocation: /a\r\n\r\n"
                                    "HTTP/1.1 200 OK\r\nLocation: /b\r\nX-Amz-Version-Id: v2\r\n\r\n");
    EXPECT_EQ(h.at("location"), "/b");
    EXPECT_EQ(h.at("x-amz-version-id"), "v2");
}

TEST(HttpHelpersTest, ParseHeaderBlockSkipsMalformedLines) {
    const auto h = parseHeaderBlock("garbage\n: novalue\nServer:  AmazonS3  \n");
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h.at("server"), "AmazonS3");
}

TEST(HttpHelpersTest, StripQuotesRemovesEveryQuote) {
    EXPECT_EQ(stripQuotes("\"9b2cf535f27731c974343645a3985328\""), "9b2cf535f27731c974343645a3985328");
    EXPECT_EQ(stripQuotes("W/\"a\"b\""), "W/ab");
    EXPECT_EQ(stripQuotes("plain"), "plain");
}

TEST(HttpHelpersTest, CaseInsensitiveComparisons) {
    EXPECT_TRUE(iequals("ETag", "etag"));
    EXPECT_FALSE(iequals("ETag", "ETags"));
    EXPECT_TRUE(iendsWith("file.MP3", ".mp3"));
    EXPECT_FALSE(iendsWith("mp3", ".mp3"));
}

TEST(HttpHelpersTest, JoinUrlNeverDoublesSlash) {
    EXPECT_EQ(joinUrl("https://api.test/", "/uploads/presign"), "https://api.test/uploads/presign");
    EXPECT_EQ(joinUrl("https://api.test", "/uploads/presign"), "https://api.test/uploads/presign");
    EXPECT_EQ(joinUrl("https://api.test//", "uploads/presign"), "https://api.test/uploads/presign");
}

TEST(HttpHelpersTest, EscapeQueryValueEncodesReservedCharacters) {
    EXPECT_EQ(escapeQueryValue("raw/Team Sync.mp3"), "raw%2FTeam%20Sync.mp3");
    EXPECT_EQ(escapeQueryValue("a-b_c.d~e"), "a-b_c.d~e");
}

TEST(HttpHelpersTest, ResponseHeaderLookupIsCaseInsensitive) {
    cn::http::Response r;
    r.status = 200;
    r.headers = {{"etag", "\"x\""}};
    EXPECT_TRUE(r.ok());
    ASSERT_TRUE(r.header("ETag").has_value());
    EXPECT_EQ(*r.header("ETAG"), "\"x\"");
    EXPECT_FALSE(r.header("Location").has_value());

    r.status = 204;
    EXPECT_TRUE(r.ok());
    r.status = 302;
    EXPECT_FALSE(r.ok());
    r.status = 200;
    r.transportError = "timeout";
    EXPECT_FALSE(r.ok());
}
