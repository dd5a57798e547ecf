///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <fmt/format.h>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/errors.hpp>

namespace bridgecraft::web
{
    namespace detail
    {
        chunk_sequence to_chunk_sequence(async::async_generator<std::string> text_chunks)
        {
            for (auto it = co_await text_chunks.begin(); it != text_chunks.end(); co_await ++it)
            {
                chunk next{std::move(*it)};
                co_yield std::move(next);
            }
        }

        chunk_sequence to_chunk_sequence(async::async_generator<bytes> byte_chunks)
        {
            for (auto it = co_await byte_chunks.begin(); it != byte_chunks.end(); co_await ++it)
            {
                chunk next{std::move(*it)};
                co_yield std::move(next);
            }
        }

        std::string_view guess_text_type(std::string_view text) noexcept
        {
            if (text.starts_with("<!DOCTYPE html>") || text.starts_with("<html>"))
                return content_types::TEXT_HTML;
            return content_types::TEXT_PLAIN;
        }
    }

    std::string_view guess_content_type(const body_value &body)
    {
        if (body.holds<std::string>())
            return detail::guess_text_type(body.get<std::string>());
        if (body.holds<nlohmann::json>())
            return content_types::APPLICATION_JSON;
        return {};
    }

    encoded_body encode_body(const body_value &body)
    {
        return std::visit(
            [](const auto &value) -> encoded_body
            {
                using value_t = std::decay_t<decltype(value)>;

                if constexpr (std::is_same_v<value_t, bytes>)
                {
                    return {value, {}};
                }
                else if constexpr (std::is_same_v<value_t, std::string>)
                {
                    return {bytes(value.begin(), value.end()), std::string{detail::guess_text_type(value)}};
                }
                else if constexpr (std::is_same_v<value_t, nlohmann::json>)
                {
                    std::string text;
                    try
                    {
                        text = value.dump();
                    }
                    catch (const nlohmann::json::type_error &e)
                    {
                        throw encoding_error(fmt::format("Could not JSON encode body: {}", e.what()));
                    }
                    return {bytes(text.begin(), text.end()), std::string{content_types::APPLICATION_JSON}};
                }
                else
                {
                    static_assert(std::is_same_v<value_t, chunk_sequence>);
                    throw encoding_error("A chunk sequence cannot be pre-encoded, it has to be streamed.");
                }
            },
            body.variant());
    }

    bytes encode_chunk(chunk &&c)
    {
        if (auto *text = std::get_if<std::string>(&c))
            return bytes(text->begin(), text->end());
        return std::move(std::get<bytes>(c));
    }

    async_t(bytes) assemble_body(async::async_generator<bytes> &chunks, std::size_t limit)
    {
        bytes result;

        for (auto it = co_await chunks.begin(); it != chunks.end(); co_await ++it)
        {
            if (result.size() + it->size() > limit)
                throw payload_too_large("Request body too large.", limit);
            result.insert(result.end(), it->begin(), it->end());
        }

        co_return result;
    }

    nlohmann::json decode_json(const bytes &data)
    {
        try
        {
            return nlohmann::json::parse(data.begin(), data.end());
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw malformed_json(fmt::format("Could not decode JSON body: {}", e.what()));
        }
    }
}
