///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <nlohmann/json.hpp>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/core.hpp>

namespace bridgecraft::web
{
    using core::bytes;

    /// @brief One unit of a streamed body. Text chunks are sent UTF-8 encoded.
    using chunk = std::variant<std::string, bytes>;

    /// @brief Lazily produced body, pulled one chunk at a time while sending.
    using chunk_sequence = async::async_generator<chunk>;

    namespace detail
    {
        chunk_sequence to_chunk_sequence(async::async_generator<std::string> text_chunks);
        chunk_sequence to_chunk_sequence(async::async_generator<bytes> byte_chunks);
    }

    /// @brief Everything a handler may return as a body.
    /// @details A closed union of raw bytes, text, a JSON value or a chunk sequence.
    /// Move-only because a chunk sequence can be consumed once.
    class body_value
    {
    public:
        using variant_type = std::variant<bytes, std::string, nlohmann::json, chunk_sequence>;

        body_value() = default;

        body_value(bytes data) : value(std::in_place_type<bytes>, std::move(data)) {}
        body_value(std::string text) : value(std::in_place_type<std::string>, std::move(text)) {}
        body_value(std::string_view text) : value(std::in_place_type<std::string>, text) {}
        body_value(const char *text) : value(std::in_place_type<std::string>, text) {}

        template <typename J>
            requires std::same_as<std::remove_cvref_t<J>, nlohmann::json>
        body_value(J &&json) : value(std::in_place_type<nlohmann::json>, std::forward<J>(json))
        {
        }

        body_value(chunk_sequence chunks) : value(std::in_place_type<chunk_sequence>, std::move(chunks)) {}
        body_value(async::async_generator<std::string> chunks)
            : value(std::in_place_type<chunk_sequence>, detail::to_chunk_sequence(std::move(chunks))) {}
        body_value(async::async_generator<bytes> chunks)
            : value(std::in_place_type<chunk_sequence>, detail::to_chunk_sequence(std::move(chunks))) {}

        body_value(body_value &&) noexcept = default;
        body_value &operator=(body_value &&) noexcept = default;
        body_value(const body_value &) = delete;
        body_value &operator=(const body_value &) = delete;

        template <typename T>
        bool holds() const noexcept
        {
            return std::holds_alternative<T>(value);
        }

        template <typename T>
        T &get()
        {
            return std::get<T>(value);
        }

        template <typename T>
        const T &get() const
        {
            return std::get<T>(value);
        }

        bool is_stream() const noexcept { return holds<chunk_sequence>(); }

        variant_type &variant() noexcept { return value; }
        const variant_type &variant() const noexcept { return value; }

    private:
        variant_type value;
    };

    /// @brief A pre-encoded body together with the content-type it implies, if any.
    struct encoded_body
    {
        bytes data;
        std::string content_type;
    };

    /// @brief Default content-type for a body, empty for bytes and chunk sequences.
    std::string_view guess_content_type(const body_value &body);

    /// @brief Encodes bytes, text or JSON into wire bytes.
    /// @throws encoding_error for values that cannot be JSON encoded and for chunk sequences,
    /// which are streamed rather than pre-encoded.
    encoded_body encode_body(const body_value &body);

    // Text chunks become their UTF-8 bytes, byte chunks pass through.
    bytes encode_chunk(chunk &&c);

    /// @brief Concatenates inbound chunks until the end of the stream.
    /// @throws payload_too_large as soon as more than `limit` bytes were seen.
    async_t(bytes) assemble_body(async::async_generator<bytes> &chunks, std::size_t limit);

    /// @throws malformed_json
    nlohmann::json decode_json(const bytes &data);
}
