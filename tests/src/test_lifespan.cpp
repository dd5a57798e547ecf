///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#define TEST_SUITE_NAME LifespanTests

#include "test_suite.hpp"
#include "mock_channel.hpp"
#include "recording_sink.hpp"
#include <stdexcept>
#include <bridgecraft/web/application.hpp>

using namespace bridgecraft::async;
using namespace bridgecraft::web;
using mock::make_scope;
using mock::recording_sink;
using mock::scripted_channel;

namespace
{
    handler unused_handler()
    {
        return [](request &) -> async_t(handler_result)
        {
            co_return "unused";
        };
    }
}

TEST_CASE(TestStartupAndShutdown)
{
    auto sink = std::make_shared<recording_sink>();
    application app(unused_handler(), {}, sink);

    int started = 0, stopped = 0;
    app.on_startup([&]() -> async_t(void)
                   {
        ++started;
        co_return; });
    app.on_shutdown([&]() -> async_t(void)
                    {
        ++stopped;
        co_return; });

    scripted_channel channel(protocol_kind::lifespan, {events::lifespan_startup{}, events::lifespan_shutdown{}});
    sync_wait(app(make_scope(protocol_kind::lifespan), channel));

    EXPECT_EQ(started, 1);
    EXPECT_EQ(stopped, 1);
    ASSERT_EQ(channel.sent.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<events::lifespan_startup_complete>(channel.sent[0]));
    EXPECT_TRUE(std::holds_alternative<events::lifespan_shutdown_complete>(channel.sent[1]));
    EXPECT_EQ(sink->count(severity::info), 2);
}

TEST_CASE(TestNoHooksStillCompletes)
{
    auto sink = std::make_shared<recording_sink>();
    application app(unused_handler(), {}, sink);

    scripted_channel channel(protocol_kind::lifespan, {events::lifespan_startup{}, events::lifespan_shutdown{}});
    sync_wait(app(make_scope(protocol_kind::lifespan), channel));

    ASSERT_EQ(channel.sent.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<events::lifespan_startup_complete>(channel.sent[0]));
    EXPECT_TRUE(std::holds_alternative<events::lifespan_shutdown_complete>(channel.sent[1]));
}

TEST_CASE(TestFailingStartupHook)
{
    auto sink = std::make_shared<recording_sink>();
    application app(unused_handler(), {}, sink);
    app.on_startup([]() -> async_t(void)
                   {
        throw std::runtime_error("database unreachable");
        co_return; });

    scripted_channel channel(protocol_kind::lifespan, {events::lifespan_startup{}, events::lifespan_shutdown{}});
    sync_wait(app(make_scope(protocol_kind::lifespan), channel));

    auto failed = channel.sent_of<events::lifespan_startup_failed>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].message, "database unreachable");
    EXPECT_EQ(sink->count(severity::error), 1);
    EXPECT_EQ(channel.sent_of<events::lifespan_shutdown_complete>().size(), 1u);
}

TEST_CASE(TestFailingShutdownHook)
{
    auto sink = std::make_shared<recording_sink>();
    application app(unused_handler(), {}, sink);
    app.on_shutdown([]() -> async_t(void)
                    {
        throw std::runtime_error("flush failed");
        co_return; });

    scripted_channel channel(protocol_kind::lifespan, {events::lifespan_startup{}, events::lifespan_shutdown{}});
    sync_wait(app(make_scope(protocol_kind::lifespan), channel));

    auto failed = channel.sent_of<events::lifespan_shutdown_failed>();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].message, "flush failed");
}

TEST_CASE(TestUnknownLifespanEventIsIgnored)
{
    auto sink = std::make_shared<recording_sink>();
    application app(unused_handler(), {}, sink);

    scripted_channel channel(protocol_kind::lifespan,
                             {events::lifespan_startup{}, events::http_disconnect{}, events::lifespan_shutdown{}});
    sync_wait(app(make_scope(protocol_kind::lifespan), channel));

    EXPECT_EQ(sink->count(severity::warning), 1);
    bool named = false;
    for (const auto &[level, text] : sink->entries)
        named = named || (level == severity::warning && text == "Unknown lifespan message http.disconnect");
    EXPECT_TRUE(named);
    EXPECT_EQ(channel.sent.size(), 2u);
}
