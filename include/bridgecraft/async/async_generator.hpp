#pragma once

///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <coroutine>
#include <exception>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace bridgecraft::async
{
    template <typename T>
    class async_generator;

    namespace detail
    {
        template <typename T>
        class async_generator_promise
        {
        public:
            using value_type = std::remove_reference_t<T>;

            async_generator_promise() noexcept = default;

            async_generator<T> get_return_object() noexcept;

            // lazy: nothing runs until the consumer awaits begin()
            std::suspend_always initial_suspend() const noexcept { return {}; }

            struct yield_awaiter
            {
                bool await_ready() const noexcept { return false; }

                std::coroutine_handle<> await_suspend(std::coroutine_handle<async_generator_promise> h) noexcept
                {
                    return h.promise().consumer;
                }

                void await_resume() noexcept {}
            };

            yield_awaiter final_suspend() noexcept
            {
                current = nullptr;
                return {};
            }

            yield_awaiter yield_value(value_type &value) noexcept
            {
                current = std::addressof(value);
                return {};
            }

            yield_awaiter yield_value(value_type &&value) noexcept
            {
                current = std::addressof(value);
                return {};
            }

            void unhandled_exception() noexcept
            {
                exception = std::current_exception();
            }

            void return_void() noexcept {}

            void rethrow_if_failed()
            {
                if (exception)
                    std::rethrow_exception(std::exchange(exception, nullptr));
            }

            value_type &value() const noexcept
            {
                return *current;
            }

            void set_consumer(std::coroutine_handle<> h) noexcept
            {
                consumer = h;
            }

        private:
            value_type *current = nullptr;
            std::exception_ptr exception;
            std::coroutine_handle<> consumer = std::noop_coroutine();
        };

        // Resumes the producer until it yields the next value or runs to completion.
        template <typename T>
        class async_generator_advance
        {
        protected:
            using handle_type = std::coroutine_handle<async_generator_promise<T>>;

            handle_type producer;

        public:
            explicit async_generator_advance(handle_type h) noexcept : producer(h) {}

            bool await_ready() const noexcept
            {
                return !producer || producer.done();
            }

            std::coroutine_handle<> await_suspend(std::coroutine_handle<> consumer) noexcept
            {
                producer.promise().set_consumer(consumer);
                return producer;
            }
        };
    }

    /// @brief Lazily evaluated, single-pass sequence whose elements may be produced asynchronously.
    /// @details Iterate with
    /// `for (auto it = co_await gen.begin(); it != gen.end(); co_await ++it)`.
    /// Exceptions thrown by the producer surface from `begin()` or `++it`.
    template <typename T>
    class async_generator
    {
    public:
        using promise_type = detail::async_generator_promise<T>;
        using handle_type = std::coroutine_handle<promise_type>;
        using value_type = typename promise_type::value_type;

        class iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using difference_type = std::ptrdiff_t;
            using value_type = typename promise_type::value_type;
            using reference = value_type &;
            using pointer = value_type *;

            iterator() noexcept = default;
            explicit iterator(handle_type h) noexcept : coro(h) {}

            bool operator==(const iterator &other) const noexcept
            {
                return coro == other.coro;
            }

            reference operator*() const noexcept
            {
                return coro.promise().value();
            }

            pointer operator->() const noexcept
            {
                return std::addressof(operator*());
            }

            auto operator++() noexcept
            {
                class increment_awaiter : public detail::async_generator_advance<T>
                {
                    iterator &it;

                public:
                    increment_awaiter(iterator &it) noexcept
                        : detail::async_generator_advance<T>(it.coro), it(it) {}

                    iterator &await_resume()
                    {
                        if (this->producer.done())
                        {
                            it.coro = nullptr;
                            this->producer.promise().rethrow_if_failed();
                        }
                        return it;
                    }
                };

                return increment_awaiter{*this};
            }

        private:
            handle_type coro = nullptr;
        };

        async_generator() noexcept = default;

        explicit async_generator(handle_type h) noexcept : coro(h) {}

        async_generator(async_generator &&other) noexcept : coro(std::exchange(other.coro, nullptr)) {}

        async_generator &operator=(async_generator &&other) noexcept
        {
            if (this != &other)
            {
                if (coro)
                    coro.destroy();
                coro = std::exchange(other.coro, nullptr);
            }
            return *this;
        }

        async_generator(const async_generator &) = delete;
        async_generator &operator=(const async_generator &) = delete;

        ~async_generator()
        {
            if (coro)
                coro.destroy();
        }

        auto begin() noexcept
        {
            class begin_awaiter : public detail::async_generator_advance<T>
            {
            public:
                using detail::async_generator_advance<T>::async_generator_advance;

                iterator await_resume()
                {
                    if (!this->producer)
                        return iterator{};
                    if (this->producer.done())
                    {
                        this->producer.promise().rethrow_if_failed();
                        return iterator{};
                    }
                    return iterator{this->producer};
                }
            };

            return begin_awaiter{coro};
        }

        iterator end() noexcept
        {
            return iterator{};
        }

    private:
        handle_type coro = nullptr;
    };

    namespace detail
    {
        template <typename T>
        async_generator<T> async_generator_promise<T>::get_return_object() noexcept
        {
            return async_generator<T>{std::coroutine_handle<async_generator_promise<T>>::from_promise(*this)};
        }
    }
}
