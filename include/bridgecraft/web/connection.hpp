///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <string_view>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/core.hpp>

namespace bridgecraft::web
{
    /// @brief Per-connection response state, owned by the request and changed only through its operations.
    /// @details init -> accepted -> streaming -> closed. WebSocket connections stay accepted while messaging.
    enum class connection_state
    {
        init,
        accepted,
        streaming,
        closed
    };

    constexpr std::string_view to_string(connection_state state) noexcept
    {
        switch (state)
        {
        case connection_state::init:
            return "init";
        case connection_state::accepted:
            return "accepted";
        case connection_state::streaming:
            return "streaming";
        case connection_state::closed:
            return "closed";
        }
        return "unknown";
    }

    constexpr bool is_open(connection_state state) noexcept
    {
        return state == connection_state::accepted || state == connection_state::streaming;
    }

    class http_request;
    class websocket_request;

    /// @brief Sends a pre-encoded response: status and headers once, then the whole body as the final chunk.
    /// @details Fills in content-type from the encoding when the headers lack one, and content-length
    /// when `set_content_length` is set and the headers lack one.
    async_t(void) write_response(http_request &req, int status, core::header_map headers, encoded_body body, bool set_content_length);

    /// @brief Streams a chunk sequence. Headers go out right before the first chunk, or after the
    /// sequence ends if it produced nothing. Each chunk is sent before the next one is pulled.
    async_t(void) stream_response(http_request &req, int status, core::header_map headers, chunk_sequence chunks);

    // Signals end of body if the response is still open.
    async_t(void) finish_response(http_request &req);

    // Sends a close frame unless the websocket is already closed.
    async_t(void) finish_websocket(websocket_request &req, int code = 1000);
}
