///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bridgecraft::web
{
    /// @brief Root of every error raised by the request layer.
    class error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;

        /// @brief Taxonomy name used in diagnostics, e.g. "ProtocolStateError".
        virtual std::string_view kind() const noexcept { return "Error"; }
    };

    // Operation not valid in the current connection state (double accept, send after close, ...)
    class protocol_state_error : public error
    {
    public:
        using error::error;
        std::string_view kind() const noexcept override { return "ProtocolStateError"; }
    };

    // Handler returned something that is not a response
    class invalid_response_shape : public error
    {
    public:
        using error::error;
        std::string_view kind() const noexcept override { return "InvalidResponseShape"; }
    };

    class encoding_error : public error
    {
    public:
        using error::error;
        std::string_view kind() const noexcept override { return "EncodingError"; }
    };

    class payload_too_large : public error
    {
    public:
        payload_too_large(const std::string &message, std::size_t limit)
            : error(message), max_size(limit) {}

        std::string_view kind() const noexcept override { return "PayloadTooLarge"; }

        std::size_t limit() const noexcept { return max_size; }

    private:
        std::size_t max_size;
    };

    class malformed_json : public error
    {
    public:
        using error::error;
        std::string_view kind() const noexcept override { return "MalformedJSON"; }
    };

    /// @brief The peer went away. Not a failure of the application.
    class peer_disconnected : public error
    {
    public:
        explicit peer_disconnected(const std::string &message, int code = 1000)
            : error(message), close_code(code) {}

        std::string_view kind() const noexcept override { return "PeerDisconnected"; }

        /// @brief WebSocket close code, 1000 when the peer did not give one.
        int code() const noexcept { return close_code; }

    private:
        int close_code;
    };

    /// @brief Deliberate rejection of a request with a given status.
    /// @details Thrown by handlers before accepting; answered with the status and message.
    class http_error : public error
    {
    public:
        http_error(int status, const std::string &message)
            : error(message), status_code(status) {}

        std::string_view kind() const noexcept override { return "HttpError"; }

        int status() const noexcept { return status_code; }

    private:
        int status_code;
    };
}
