///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <bridgecraft/web/connection.hpp>
#include <bridgecraft/web/request.hpp>

namespace bridgecraft::web
{
    async_t(void) write_response(http_request &req, int status, core::header_map headers, encoded_body body, bool set_content_length)
    {
        if (!body.content_type.empty())
            headers.try_emplace(std::string{web::headers::CONTENT_TYPE}, std::move(body.content_type));
        if (set_content_length)
            headers.try_emplace(std::string{web::headers::CONTENT_LENGTH}, std::to_string(body.data.size()));

        chunk payload{std::move(body.data)};
        co_await req.accept(status, std::move(headers));
        co_await req.send(std::move(payload), false);
    }

    async_t(void) stream_response(http_request &req, int status, core::header_map headers, chunk_sequence chunks)
    {
        for (auto it = co_await chunks.begin(); it != chunks.end(); co_await ++it)
        {
            if (req.state() == connection_state::init)
                co_await req.accept(status, headers);
            co_await req.send(std::move(*it));
        }

        if (req.state() == connection_state::init)
            co_await req.accept(status, std::move(headers));
    }

    async_t(void) finish_response(http_request &req)
    {
        if (is_open(req.state()))
        {
            chunk last;
            co_await req.send(std::move(last), false);
        }
    }

    async_t(void) finish_websocket(websocket_request &req, int code)
    {
        if (req.state() != connection_state::closed)
            co_await req.close(code);
    }
}
