///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/body.hpp>
#include <bridgecraft/web/config.hpp>
#include <bridgecraft/web/connection.hpp>
#include <bridgecraft/web/core.hpp>
#include <bridgecraft/web/events.hpp>

namespace bridgecraft::web
{
    using core::header_map;
    using core::query_dict;
    using core::query_list;

    /// @brief What every request offers, whatever the protocol.
    /// @details Wraps the scope and the channel of one connection for the duration of one
    /// handler call. Derived values are computed from the scope on first use and cached.
    /// Not safe for concurrent use.
    class request
    {
    public:
        request(web::scope s, channel &io);
        virtual ~request() = default;

        request(const request &) = delete;
        request &operator=(const request &) = delete;

        const web::scope &scope() const noexcept { return connection_scope; }
        protocol_kind kind() const noexcept { return connection_scope.type; }

        const std::string &method() const noexcept { return connection_scope.method; }

        // keys are case-insensitive
        const header_map &headers() const;

        // scheme://host:port/path?query, unquoted
        std::string url() const;
        const std::string &scheme() const noexcept { return connection_scope.scheme; }

        // From the Host header when present, otherwise the server address
        std::string host() const;
        int port() const;
        std::string path() const;

        const query_list &querylist() const;
        query_dict querydict() const;

        connection_state state() const noexcept { return current; }

        /// @throws protocol_state_error when the request is not of that kind
        http_request &as_http();
        websocket_request &as_websocket();

    protected:
        channel &io;
        connection_state current = connection_state::init;

    private:
        web::scope connection_scope;
        mutable std::optional<header_map> header_cache;
        mutable std::optional<query_list> query_cache;
    };

    /// @brief An HTTP request: body access plus the low-level response path.
    class http_request : public request
    {
    public:
        http_request(web::scope s, channel &io, std::size_t body_limit = default_body_limit);

        /// @brief Single-pass sequence of the body chunks as they arrive.
        /// @details A second call yields nothing. A client disconnect ends the sequence early.
        async::async_generator<bytes> iter_body();

        /// @brief The complete body, cached after the first call.
        /// @throws payload_too_large, peer_disconnected, protocol_state_error
        async_t(bytes) get_body();
        async_t(bytes) get_body(std::size_t limit);

        /// @throws malformed_json in addition to what get_body throws
        async_t(nlohmann::json) get_json();
        async_t(nlohmann::json) get_json(std::size_t limit);

        // Drains inbound events until the client goes away.
        async_t(void) wait_for_disconnect();

        /// @brief Sends status and headers. Allowed once, before any body chunk.
        /// @throws protocol_state_error, invalid_response_shape, peer_disconnected
        async_t(void) accept(int status, header_map headers);
        async_t(void) accept(int status = core::response_code::OK);

        /// @brief Sends one body chunk, accepting with 200 first if needed.
        /// @details `more = false` marks the last chunk and closes the stream.
        async_t(void) send(chunk data, bool more = true);

        bool disconnected() const noexcept { return client_gone; }

    private:
        std::size_t limit;
        bool body_consumed = false;
        bool client_gone = false;
        std::optional<bytes> body_cache;
    };

    /// @brief A WebSocket connection. The handler drives it with accept, send and receive.
    class websocket_request : public request
    {
    public:
        websocket_request(web::scope s, channel &io);

        async_t(void) accept(std::optional<std::string> subprotocol);
        async_t(void) accept();

        /// @brief Waits for the next message.
        /// @throws peer_disconnected when the client goes away, protocol_state_error before accept or after close
        async_t(message) receive();

        /// @brief Messages until the client closes. Abnormal close codes raise peer_disconnected.
        async::async_generator<message> receive_iter();

        async_t(nlohmann::json) receive_json();

        async_t(void) send(std::string text);
        async_t(void) send(const char *text);
        async_t(void) send(bytes data);
        // sent as a text message
        async_t(void) send(const nlohmann::json &value);

        async_t(void) close(int code = 1000);

        bool disconnected() const noexcept { return client_gone; }

    private:
        async_t(void) send_message(message payload);

        bool connect_seen = false;
        bool client_gone = false;
    };

    /// @brief Close codes that end a websocket normally: 1000, 1001 and 1005.
    constexpr bool is_normal_closure(int code) noexcept
    {
        return code == 1000 || code == 1001 || code == 1005;
    }
}
