///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/core.hpp>

namespace bridgecraft::web
{
    using core::bytes;
    using core::header_list;

    enum class protocol_kind
    {
        http,
        websocket,
        lifespan
    };

    constexpr std::string_view to_string(protocol_kind kind) noexcept
    {
        switch (kind)
        {
        case protocol_kind::http:
            return "http";
        case protocol_kind::websocket:
            return "websocket";
        case protocol_kind::lifespan:
            return "lifespan";
        }
        return "unknown";
    }

    struct address
    {
        std::string host;
        int port = 0;
    };

    /// @brief Immutable description of one connection, supplied by the host server.
    struct scope
    {
        protocol_kind type = protocol_kind::http;
        std::string http_version = "1.1";
        std::string method = "GET";
        std::string scheme = "http";
        // already percent-decoded by the host
        std::string path = "/";
        std::string root_path;
        // raw, not percent-decoded
        std::string query_string;
        header_list headers;
        std::optional<address> client;
        std::optional<address> server;
        std::vector<std::string> subprotocols;
    };

    /// @brief A WebSocket payload, text or binary.
    using message = std::variant<std::string, bytes>;

    namespace events
    {
        // inbound

        struct http_request
        {
            bytes body;
            bool more_body = false;
        };

        struct http_disconnect
        {
        };

        struct websocket_connect
        {
        };

        struct websocket_receive
        {
            message payload;
        };

        struct websocket_disconnect
        {
            int code = 1000;
        };

        struct lifespan_startup
        {
        };

        struct lifespan_shutdown
        {
        };

        // outbound

        struct http_response_start
        {
            int status = 200;
            header_list headers;
        };

        struct http_response_body
        {
            bytes body;
            bool more_body = false;
        };

        struct websocket_accept
        {
            std::optional<std::string> subprotocol;
        };

        struct websocket_send
        {
            message payload;
        };

        struct websocket_close
        {
            int code = 1000;
        };

        struct lifespan_startup_complete
        {
        };

        struct lifespan_startup_failed
        {
            std::string message;
        };

        struct lifespan_shutdown_complete
        {
        };

        struct lifespan_shutdown_failed
        {
            std::string message;
        };
    }

    using inbound_event = std::variant<
        events::http_request,
        events::http_disconnect,
        events::websocket_connect,
        events::websocket_receive,
        events::websocket_disconnect,
        events::lifespan_startup,
        events::lifespan_shutdown>;

    using outbound_event = std::variant<
        events::http_response_start,
        events::http_response_body,
        events::websocket_accept,
        events::websocket_send,
        events::websocket_close,
        events::lifespan_startup_complete,
        events::lifespan_startup_failed,
        events::lifespan_shutdown_complete,
        events::lifespan_shutdown_failed>;

    /// @brief The two capabilities the host server hands to the application for one connection.
    class channel
    {
    public:
        virtual ~channel() = default;

        /// @brief Suspends until the next inbound event arrives.
        virtual async_t(inbound_event) receive() = 0;

        /// @brief Sends one outbound event, suspending while the host applies backpressure.
        virtual async_t(void) send(outbound_event event) = 0;
    };
}
