///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#define TEST_SUITE_NAME BodyTests

#include "test_suite.hpp"
#include <limits>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/errors.hpp>

using namespace bridgecraft::async;
using namespace bridgecraft::web;

namespace
{
    async_generator<bytes> chunks_of(std::vector<std::string> parts)
    {
        for (auto &part : parts)
        {
            bytes next(part.begin(), part.end());
            co_yield std::move(next);
        }
    }
}

TEST_CASE(TestGuessContentType)
{
    EXPECT_EQ(guess_content_type(body_value{"<!DOCTYPE html><p>hi</p>"}), "text/html");
    EXPECT_EQ(guess_content_type(body_value{"<html><body></body></html>"}), "text/html");
    EXPECT_EQ(guess_content_type(body_value{"<!doctype html>"}), "text/plain") << "the prefix check is case sensitive";
    EXPECT_EQ(guess_content_type(body_value{" <html>"}), "text/plain");
    EXPECT_EQ(guess_content_type(body_value{"hello"}), "text/plain");
    EXPECT_EQ(guess_content_type(body_value{nlohmann::json{{"a", 1}}}), "application/json");
    EXPECT_EQ(guess_content_type(body_value{to_bytes("raw")}), "");
    EXPECT_EQ(guess_content_type(body_value{chunks_of({"x"})}), "");
}

TEST_CASE(TestEncodeText)
{
    auto encoded = encode_body(body_value{std::string{"h\xC3\xA9llo"}});
    EXPECT_EQ(to_text(encoded.data), "h\xC3\xA9llo");
    EXPECT_EQ(encoded.content_type, "text/plain");

    auto html = encode_body(body_value{"<html></html>"});
    EXPECT_EQ(html.content_type, "text/html");
}

TEST_CASE(TestEncodeBytesPassesThrough)
{
    bytes raw{'\0', '\x01', '\xff'};
    auto encoded = encode_body(body_value{raw});
    EXPECT_EQ(encoded.data, raw);
    EXPECT_TRUE(encoded.content_type.empty()) << "bytes never get an inferred content-type";
}

TEST_CASE(TestEncodeJson)
{
    nlohmann::json value{{"path", "/api/x"}, {"n", 3}};
    auto encoded = encode_body(body_value{value});

    EXPECT_EQ(encoded.content_type, "application/json");
    EXPECT_EQ(nlohmann::json::parse(to_text(encoded.data)), value);
}

TEST_CASE(TestEncodeJsonFailure)
{
    // invalid UTF-8 cannot be serialized
    nlohmann::json value{{"bad", std::string{"\xff\xfe"}}};
    EXPECT_THROW(encode_body(body_value{value}), encoding_error);
}

TEST_CASE(TestEncodeChunkSequenceIsRejected)
{
    body_value body{chunks_of({"a", "b"})};
    EXPECT_TRUE(body.is_stream());
    EXPECT_THROW(encode_body(body), encoding_error);
}

TEST_CASE(TestEncodeChunk)
{
    EXPECT_EQ(to_text(encode_chunk(chunk{std::string{"foo"}})), "foo");
    EXPECT_EQ(to_text(encode_chunk(chunk{to_bytes("bar")})), "bar");
}

TEST_CASE(TestTextGeneratorBecomesChunkSequence)
{
    auto text_chunks = []() -> async_generator<std::string>
    {
        for (std::string part : {"foo", "bar"})
            co_yield std::move(part);
    };

    body_value body{text_chunks()};
    ASSERT_TRUE(body.is_stream());

    std::vector<std::string> seen;
    sync_wait([&]() -> task<>
              {
        auto &chunks = body.get<chunk_sequence>();
        for (auto it = co_await chunks.begin(); it != chunks.end(); co_await ++it)
            seen.push_back(to_text(encode_chunk(std::move(*it)))); }());

    EXPECT_EQ(seen, (std::vector<std::string>{"foo", "bar"}));
}

TEST_CASE(TestAssembleBodyWithinLimit)
{
    auto chunks = chunks_of({"01234", "56789"});
    auto data = sync_wait(assemble_body(chunks, 10));
    EXPECT_EQ(to_text(data), "0123456789");
}

TEST_CASE(TestAssembleBodyOverLimit)
{
    auto chunks = chunks_of({"01234", "567890"});
    try
    {
        sync_wait(assemble_body(chunks, 10));
        FAIL() << "expected payload_too_large";
    }
    catch (const payload_too_large &e)
    {
        EXPECT_EQ(e.limit(), 10u);
        EXPECT_EQ(e.kind(), "PayloadTooLarge");
    }
}

TEST_CASE(TestDecodeJson)
{
    auto value = decode_json(to_bytes(R"({"a": [1, 2]})"));
    EXPECT_EQ(value["a"][1], 2);

    EXPECT_THROW(decode_json(to_bytes("{not json")), malformed_json);
    EXPECT_THROW(decode_json(bytes{}), malformed_json);
}
