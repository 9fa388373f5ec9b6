#include "utils/query_string.h"
#include <gtest/gtest.h>

using eio::utils::decode_query;
using eio::utils::url_decode;

TEST(QueryStringTest, SplitsPairs) {
    auto query = decode_query("transport=polling&sid=abc&EIO=4");
    EXPECT_EQ(query.size(), 3u);
    EXPECT_EQ(query["transport"], "polling");
    EXPECT_EQ(query["sid"], "abc");
    EXPECT_EQ(query["EIO"], "4");
}

TEST(QueryStringTest, LeadingQuestionMarkIsIgnored) {
    auto query = decode_query("?transport=websocket");
    EXPECT_EQ(query.count("transport"), 1u);
    EXPECT_EQ(query["transport"], "websocket");
}

TEST(QueryStringTest, LastDuplicateWins) {
    auto query = decode_query("sid=first&sid=second");
    EXPECT_EQ(query["sid"], "second");
}

TEST(QueryStringTest, KeyWithoutValueIsEmpty) {
    auto query = decode_query("b64&transport=polling&&");
    EXPECT_EQ(query.count("b64"), 1u);
    EXPECT_EQ(query["b64"], "");
    EXPECT_EQ(query["transport"], "polling");
    EXPECT_EQ(query.count(""), 0u);
}

TEST(QueryStringTest, ValueSplitsOnFirstEquals) {
    auto query = decode_query("token=a=b");
    EXPECT_EQ(query["token"], "a=b");
}

TEST(QueryStringTest, PercentAndPlusDecoding) {
    EXPECT_EQ(url_decode("a%20b+c"), "a b c");
    EXPECT_EQ(url_decode("%2Fpath%2f"), "/path/");
    EXPECT_EQ(url_decode("100%"), "100%");
    EXPECT_EQ(url_decode("%zz"), "%zz");

    auto query = decode_query("sid=a%2Eb");
    EXPECT_EQ(query["sid"], "a.b");
}

TEST(QueryStringTest, EmptyInput) {
    EXPECT_TRUE(decode_query("").empty());
    EXPECT_TRUE(decode_query("?").empty());
}
