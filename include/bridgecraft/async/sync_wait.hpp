#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include "awaitable.hpp"
#include "event_signal.hpp"

namespace bridgecraft::async
{
    namespace detail
    {
        // Drives an awaitable from a non-coroutine caller. The signal is set only
        // once the frame is suspended for good, so the caller may destroy it then.
        class sync_wait_runner
        {
        public:
            struct promise_type
            {
                event_signal *done = nullptr;
                std::exception_ptr failure;

                sync_wait_runner get_return_object() noexcept
                {
                    return sync_wait_runner{std::coroutine_handle<promise_type>::from_promise(*this)};
                }

                std::suspend_always initial_suspend() noexcept { return {}; }

                auto final_suspend() noexcept
                {
                    struct notify_awaiter
                    {
                        bool await_ready() noexcept { return false; }
                        void await_suspend(std::coroutine_handle<promise_type> h) noexcept { h.promise().done->set(); }
                        void await_resume() noexcept {}
                    };
                    return notify_awaiter{};
                }

                void return_void() noexcept {}

                void unhandled_exception() noexcept
                {
                    failure = std::current_exception();
                }
            };

            explicit sync_wait_runner(std::coroutine_handle<promise_type> h) noexcept : coro(h) {}
            sync_wait_runner(sync_wait_runner &&other) noexcept : coro(std::exchange(other.coro, {})) {}
            sync_wait_runner(const sync_wait_runner &) = delete;
            sync_wait_runner &operator=(const sync_wait_runner &) = delete;

            ~sync_wait_runner()
            {
                if (coro)
                    coro.destroy();
            }

            void run_to_completion()
            {
                event_signal done;
                coro.promise().done = &done;
                coro.resume();
                done.wait();

                if (coro.promise().failure)
                    std::rethrow_exception(coro.promise().failure);
            }

        private:
            std::coroutine_handle<promise_type> coro;
        };

        template <typename A, typename R>
        sync_wait_runner store_result(A &awaitable, std::optional<R> &out)
        {
            out.emplace(co_await awaitable);
        }

        template <typename A>
        sync_wait_runner discard_result(A &awaitable)
        {
            co_await awaitable;
        }
    }

    /// @brief Blocks the calling thread until the awaitable completes, then returns its result or rethrows.
    template <awaitable_t T>
    awaitable_resume_t<T> sync_wait(T &&awaitable)
    {
        using result_type = awaitable_resume_t<T>;

        if constexpr (std::is_void_v<result_type>)
        {
            detail::discard_result(awaitable).run_to_completion();
        }
        else
        {
            std::optional<result_type> result;
            detail::store_result(awaitable, result).run_to_completion();
            return std::move(*result);
        }
    }
}
