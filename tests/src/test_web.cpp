///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#define TEST_SUITE_NAME WebTests

#include "test_suite.hpp"
#include <bridgecraft/web/core.hpp>

using namespace bridgecraft::web::core;

TEST_CASE(TestStatusHelpers)
{
    EXPECT_EQ(status_text(response_code::NOT_FOUND), "Not Found");
    EXPECT_EQ(status_text(response_code::INTERNAL_SERVER_ERROR), "Internal Server Error");
    EXPECT_EQ(status_text(299), "Unknown");

    EXPECT_TRUE(is_valid_status(100));
    EXPECT_TRUE(is_valid_status(999));
    EXPECT_FALSE(is_valid_status(99));
    EXPECT_FALSE(is_valid_status(1000));
}

TEST_CASE(TestHeaderMapIsCaseInsensitive)
{
    header_map headers;
    headers.emplace("Content-Type", "text/plain");

    EXPECT_EQ(headers.count("content-type"), 1u);
    EXPECT_EQ(headers.at("CONTENT-TYPE"), "text/plain");

    // the first spelling wins, later inserts with another case do not add a key
    headers.try_emplace("content-type", "application/json");
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers.begin()->first, "Content-Type");
    EXPECT_EQ(headers.begin()->second, "text/plain");
}

TEST_CASE(TestHeaderListConversion)
{
    header_list list{{"Host", "a.com"}, {"X-Token", "1"}, {"host", "b.com"}};

    auto map = to_header_map(list);
    ASSERT_EQ(map.size(), 2u);
    EXPECT_EQ(map.at("host"), "b.com") << "later duplicates win";
    EXPECT_EQ(map.begin()->first, "Host");

    auto back = to_header_list(map);
    EXPECT_EQ(back.size(), 2u);
}

TEST_CASE(TestPercentDecode)
{
    EXPECT_EQ(percent_decode("a%20b"), "a b");
    EXPECT_EQ(percent_decode("%7e%7E"), "~~");
    EXPECT_EQ(percent_decode("a+b"), "a+b");
    EXPECT_EQ(percent_decode("a+b", true), "a b");
    EXPECT_EQ(percent_decode("100%"), "100%") << "truncated escapes stay verbatim";
    EXPECT_EQ(percent_decode("%zz"), "%zz") << "invalid escapes stay verbatim";
    EXPECT_EQ(percent_decode("caf%C3%A9"), "caf\xC3\xA9");
}

TEST_CASE(TestParseQuery)
{
    auto list = parse_query("a=1&b=x+y&a=2&empty=&flag&c=%2F");

    ASSERT_EQ(list.size(), 4u);
    EXPECT_EQ(list[0], (std::pair<std::string, std::string>{"a", "1"}));
    EXPECT_EQ(list[1], (std::pair<std::string, std::string>{"b", "x y"}));
    EXPECT_EQ(list[2], (std::pair<std::string, std::string>{"a", "2"}));
    EXPECT_EQ(list[3], (std::pair<std::string, std::string>{"c", "/"}));

    auto dict = to_query_dict(list);
    EXPECT_EQ(dict.size(), 3u);
    EXPECT_EQ(dict.at("a"), "2") << "the last value wins";

    EXPECT_TRUE(parse_query("").empty());
    EXPECT_TRUE(parse_query("&&").empty());
}
