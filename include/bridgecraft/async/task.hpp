#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <atomic>
#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include "awaitable.hpp"

namespace bridgecraft::async
{
    // Forward declare
    template <typename T>
    class task;

    namespace detail
    {
        // Resumes the awaiting coroutine once the task body has finished.
        // The body and the awaiter race on `handoff`; whichever arrives second resumes.
        template <typename Promise>
        struct task_final_awaiter
        {
            bool await_ready() noexcept { return false; }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<Promise> h) noexcept
            {
                auto &promise = h.promise();
                if (promise.handoff.exchange(true, std::memory_order_acq_rel))
                    return promise.continuation;
                return std::noop_coroutine();
            }

            void await_resume() noexcept {}
        };
    }

    template <typename T>
    class task_promise
    {
    public:
        std::optional<T> value;
        std::exception_ptr exception;
        std::coroutine_handle<> continuation;
        std::atomic<bool> handoff{false};

        task<T> get_return_object();

        std::suspend_never initial_suspend() noexcept { return {}; }

        detail::task_final_awaiter<task_promise> final_suspend() noexcept { return {}; }

        template <typename U = T>
            requires std::convertible_to<U &&, T>
        void return_value(U &&v) noexcept(std::is_nothrow_constructible_v<T, U &&>)
        {
            value.emplace(std::forward<U>(v));
        }

        void unhandled_exception() noexcept
        {
            exception = std::current_exception();
        }
    };

    template <>
    class task_promise<void>
    {
    public:
        std::exception_ptr exception;
        std::coroutine_handle<> continuation;
        std::atomic<bool> handoff{false};

        task<void> get_return_object();

        std::suspend_never initial_suspend() noexcept { return {}; }

        detail::task_final_awaiter<task_promise> final_suspend() noexcept { return {}; }

        void return_void() noexcept {}

        void unhandled_exception() noexcept
        {
            exception = std::current_exception();
        }
    };

    /// @brief Eagerly started coroutine producing a single value of type T.
    /// @details The body runs until its first real suspension when the coroutine is called.
    /// Exceptions thrown by the body are stored and rethrown when the task is awaited.
    template <typename T = void>
    class task
    {
    public:
        using promise_type = task_promise<T>;
        using handle_type = std::coroutine_handle<promise_type>;

        explicit task(handle_type h) noexcept : coro(h) {}

        task(task &&other) noexcept : coro(std::exchange(other.coro, {})) {}
        task &operator=(task &&other) noexcept
        {
            if (this != &other)
            {
                if (coro)
                    coro.destroy();
                coro = std::exchange(other.coro, {});
            }
            return *this;
        }

        ~task()
        {
            if (coro)
                coro.destroy();
        }

        task(const task &) = delete;
        task &operator=(const task &) = delete;

        bool await_ready() const noexcept
        {
            return !coro || coro.promise().handoff.load(std::memory_order_acquire);
        }

        bool await_suspend(std::coroutine_handle<> h) noexcept
        {
            coro.promise().continuation = h;
            return !coro.promise().handoff.exchange(true, std::memory_order_acq_rel);
        }

        T await_resume()
        {
            if (coro.promise().exception)
                std::rethrow_exception(coro.promise().exception);
            return std::move(*coro.promise().value);
        }

    private:
        friend class task_promise<T>;
        handle_type coro;
    };

    template <>
    class task<void>
    {
    public:
        using promise_type = task_promise<void>;
        using handle_type = std::coroutine_handle<promise_type>;

        explicit task(handle_type h) noexcept : coro(h) {}

        task(task &&other) noexcept : coro(std::exchange(other.coro, {})) {}
        task &operator=(task &&other) noexcept
        {
            if (this != &other)
            {
                if (coro)
                    coro.destroy();
                coro = std::exchange(other.coro, {});
            }
            return *this;
        }

        ~task()
        {
            if (coro)
                coro.destroy();
        }

        task(const task &) = delete;
        task &operator=(const task &) = delete;

        bool await_ready() const noexcept
        {
            return !coro || coro.promise().handoff.load(std::memory_order_acquire);
        }

        bool await_suspend(std::coroutine_handle<> h) noexcept
        {
            coro.promise().continuation = h;
            return !coro.promise().handoff.exchange(true, std::memory_order_acq_rel);
        }

        void await_resume()
        {
            if (coro.promise().exception)
                std::rethrow_exception(coro.promise().exception);
        }

    private:
        friend class task_promise<void>;
        handle_type coro;
    };

    // Define get_return_object after task is complete
    template <typename T>
    task<T> task_promise<T>::get_return_object()
    {
        return task<T>{std::coroutine_handle<task_promise>::from_promise(*this)};
    }

    inline task<void> task_promise<void>::get_return_object()
    {
        return task<void>{std::coroutine_handle<task_promise>::from_promise(*this)};
    }
}
