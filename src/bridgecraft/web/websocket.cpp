///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <fmt/format.h>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/request.hpp>

namespace bridgecraft::web
{
    websocket_request::websocket_request(web::scope s, channel &io) : request(std::move(s), io)
    {
    }

    async_t(void) websocket_request::accept()
    {
        return accept(std::optional<std::string>{});
    }

    async_t(void) websocket_request::accept(std::optional<std::string> subprotocol)
    {
        if (current != connection_state::init)
            throw protocol_state_error(fmt::format("Cannot accept a websocket that is already {}.", to_string(current)));

        if (!connect_seen)
        {
            auto event = co_await io.receive();
            if (auto *gone = std::get_if<events::websocket_disconnect>(&event))
            {
                client_gone = true;
                current = connection_state::closed;
                throw peer_disconnected("Client disconnected before the handshake.", gone->code);
            }
            if (!std::holds_alternative<events::websocket_connect>(event))
                throw protocol_state_error("Expected a websocket connect event before accepting.");
            connect_seen = true;
        }

        outbound_event handshake = events::websocket_accept{std::move(subprotocol)};
        co_await io.send(std::move(handshake));
        current = connection_state::accepted;
    }

    async_t(message) websocket_request::receive()
    {
        if (current == connection_state::init)
            throw protocol_state_error("Cannot receive before the websocket is accepted.");
        if (current == connection_state::closed)
            throw protocol_state_error("Cannot receive from a closed websocket.");

        while (true)
        {
            auto event = co_await io.receive();

            if (auto *received = std::get_if<events::websocket_receive>(&event))
                co_return std::move(received->payload);

            if (auto *gone = std::get_if<events::websocket_disconnect>(&event))
            {
                client_gone = true;
                current = connection_state::closed;
                throw peer_disconnected(fmt::format("Client disconnected with code {}.", gone->code), gone->code);
            }
        }
    }

    async::async_generator<message> websocket_request::receive_iter()
    {
        while (true)
        {
            std::optional<message> next;
            try
            {
                next.emplace(co_await receive());
            }
            catch (const peer_disconnected &e)
            {
                if (!is_normal_closure(e.code()))
                    throw;
            }

            if (!next)
                co_return;
            co_yield std::move(*next);
        }
    }

    async_t(nlohmann::json) websocket_request::receive_json()
    {
        auto received = co_await receive();

        if (auto *text = std::get_if<std::string>(&received))
            co_return decode_json(bytes(text->begin(), text->end()));
        co_return decode_json(std::get<bytes>(received));
    }

    async_t(void) websocket_request::send_message(message payload)
    {
        if (current == connection_state::init)
            throw protocol_state_error("Cannot send before the websocket is accepted.");
        if (current == connection_state::closed)
            throw protocol_state_error("Cannot send on a closed websocket.");

        outbound_event frame = events::websocket_send{std::move(payload)};
        co_await io.send(std::move(frame));
    }

    async_t(void) websocket_request::send(std::string text)
    {
        return send_message(message{std::in_place_type<std::string>, std::move(text)});
    }

    async_t(void) websocket_request::send(const char *text)
    {
        return send_message(message{std::in_place_type<std::string>, text});
    }

    async_t(void) websocket_request::send(bytes data)
    {
        return send_message(message{std::in_place_type<bytes>, std::move(data)});
    }

    async_t(void) websocket_request::send(const nlohmann::json &value)
    {
        std::string text;
        try
        {
            text = value.dump();
        }
        catch (const nlohmann::json::type_error &e)
        {
            throw encoding_error(fmt::format("Could not JSON encode message: {}", e.what()));
        }
        return send_message(message{std::in_place_type<std::string>, std::move(text)});
    }

    async_t(void) websocket_request::close(int code)
    {
        if (current == connection_state::closed)
            throw protocol_state_error("Cannot close a websocket twice.");

        current = connection_state::closed;
        outbound_event frame = events::websocket_close{code};
        co_await io.send(std::move(frame));
    }
}
