#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <concepts>
#include <coroutine>
#include <type_traits>
#include <utility>

namespace bridgecraft::async
{
    namespace detail
    {
        template <typename S>
        concept suspend_result = std::same_as<S, void> || std::same_as<S, bool> || std::convertible_to<S, std::coroutine_handle<>>;
    }

    /// @brief A type whose values can be suspended on directly.
    template <typename A>
    concept awaiter = requires(A &a, std::coroutine_handle<> h) {
        { a.await_ready() } -> std::convertible_to<bool>;
        { a.await_suspend(h) } -> detail::suspend_result;
        a.await_resume();
    };

    template <typename T>
    concept member_co_await = requires(T &&t) {
        { std::forward<T>(t).operator co_await() } -> awaiter;
    };

    template <typename T>
    concept free_co_await = requires(T &&t) {
        { operator co_await(std::forward<T>(t)) } -> awaiter;
    };

    /// @brief Anything a coroutine can co_await: an awaiter, or a type with operator co_await.
    template <typename T>
    concept awaitable_t = awaiter<std::remove_reference_t<T>> || member_co_await<T> || free_co_await<T>;

    namespace detail
    {
        template <awaitable_t T>
        decltype(auto) awaiter_for(T &&t)
        {
            if constexpr (member_co_await<T>)
                return std::forward<T>(t).operator co_await();
            else if constexpr (free_co_await<T>)
                return operator co_await(std::forward<T>(t));
            else
                return std::forward<T>(t);
        }
    }

    /// @brief What `co_await` on a T produces.
    template <awaitable_t T>
    using awaitable_resume_t = decltype(detail::awaiter_for(std::declval<T>()).await_resume());
}
