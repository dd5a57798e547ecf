///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#define TEST_SUITE_NAME TaskTestSuite

#include "test_suite.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <bridgecraft/async/async.hpp>

using namespace bridgecraft::async;

// ensure that not_awaitable is not considered awaitable
struct not_awaitable
{
};

static_assert(!awaitable_t<not_awaitable>, "not_awaitable should not be considered awaitable");

struct awaitable_with_co_await
{
    auto operator co_await() const noexcept { return std::suspend_always{}; }
};

static_assert(awaitable_t<awaitable_with_co_await>, "awaitable_with_co_await should be considered awaitable");
static_assert(std::same_as<awaitable_resume_t<awaitable_with_co_await>, void>, "awaitable_with_co_await should resume to void");

struct awaitable_with_resume_type_int
{
    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<>) const noexcept {}
    int await_resume() const noexcept { return 42; }
};

static_assert(awaitable_t<awaitable_with_resume_type_int>, "awaitable_with_resume_type_int should be considered awaitable");
static_assert(std::same_as<awaitable_resume_t<awaitable_with_resume_type_int>, int>, "awaitable_with_resume_type_int should resume to int");

static_assert(awaitable_t<task<int>>, "task<int> should be considered awaitable");
static_assert(std::same_as<awaitable_resume_t<task<int>>, int>, "task<int> should resume to int");
static_assert(awaitable_t<task<void>>, "task<void> should be considered awaitable");
static_assert(std::same_as<awaitable_resume_t<task<void>>, void>, "task<void> should resume to void");

static_assert(std::same_as<decltype(sync_wait(std::declval<task<void>>())), void>, "sync_wait should return void for task<void>");
static_assert(std::same_as<decltype(sync_wait(std::declval<task<int>>())), int>, "sync_wait should return int for task<int>");

TEST_CASE(TestingWithSyncWaitVoid)
{
    event_signal signal;

    auto makeTask = [&]() -> task<>
    {
        signal.set();
        co_return;
    };

    auto task = makeTask();
    sync_wait(task);
    EXPECT_TRUE(signal.is_set()) << "sync_wait should set the signal";

    signal.reset();

    sync_wait(makeTask());
    EXPECT_TRUE(signal.is_set()) << "sync_wait should set the signal again";
}

TEST_CASE(TestingWithSyncWait)
{
    auto makeTask = []() -> task<std::string>
    {
        co_return "foo";
    };

    auto task = makeTask();
    EXPECT_EQ(sync_wait(task), "foo") << "sync_wait should return 'foo' from the task";

    EXPECT_EQ(sync_wait(makeTask()), "foo") << "sync_wait should return 'foo' from the task";
}

TEST_CASE(TestingSyncWaitWithAnotherThread)
{
    struct thread_awaitable
    {
        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<> h) const noexcept
        {
            std::thread([h]()
                        { h.resume(); })
                .detach();
        }
        void await_resume() const noexcept {}
    };

    auto asyncfn = []() -> task<void>
    {
        auto id = std::this_thread::get_id();
        co_await thread_awaitable();
        auto new_id = std::this_thread::get_id();
        EXPECT_NE(id, new_id) << "Task should resume on a different thread";
    };

    sync_wait(asyncfn());
}

TEST_CASE(TestTaskThroughput)
{
    auto completesSynchronously = []() -> task<int>
    {
        co_return 1;
    };

    auto run = [&]() -> task<>
    {
        int sum = 0;
        for (int i = 0; i < 1'000'000; ++i)
        {
            sum += co_await completesSynchronously();
        }
        EXPECT_EQ(sum, 1'000'000) << "Sum should be 1,000,000";
    };

    sync_wait(run());
}

TEST_CASE(TestTaskThrows)
{
    auto throws = []() -> task<int>
    {
        throw std::runtime_error("Test exception");
        co_return 42; // This line should never be reached
    };

    EXPECT_THROW(sync_wait(throws()), std::runtime_error) << "sync_wait should throw std::runtime_error";
}

TEST_CASE(TestTaskPropagatesThroughAwaitChain)
{
    auto inner = []() -> task<int>
    {
        throw std::logic_error("inner failure");
        co_return 1;
    };

    auto outer = [&]() -> task<int>
    {
        co_return co_await inner() + 1;
    };

    EXPECT_THROW(sync_wait(outer()), std::logic_error);
}

TEST_CASE(TestTaskEagerness)
{
    event_signal signal;

    auto async_fn = [&]() -> task<void>
    {
        signal.set();
        co_return;
    };

    auto _ = async_fn();

    EXPECT_TRUE(signal.is_set()) << "Signal should be set immediately after task creation";
}

TEST_CASE(TestTaskMoveOnlyResult)
{
    auto make = []() -> task<std::unique_ptr<int>>
    {
        co_return std::make_unique<int>(7);
    };

    auto value = sync_wait(make());
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 7);
}

TEST_CASE(TestAsyncMacros)
{
    int calls = 0;

    auto fn = co_async
    {
        ++calls;
        co_return;
    };

    sync_wait(fn());
    EXPECT_EQ(calls, 1);
}
