///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <fmt/format.h>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/request.hpp>
#include <bridgecraft/web/response.hpp>

namespace bridgecraft::web
{
    request::request(web::scope s, channel &io) : io(io), connection_scope(std::move(s))
    {
    }

    const header_map &request::headers() const
    {
        if (!header_cache)
            header_cache = core::to_header_map(connection_scope.headers);
        return *header_cache;
    }

    std::string request::url() const
    {
        std::string result = fmt::format("{}://{}:{}{}", scheme(), host(), port(), path());

        const auto &query = querylist();
        for (size_t i = 0; i < query.size(); ++i)
        {
            result += i == 0 ? '?' : '&';
            result += query[i].first;
            result += '=';
            result += query[i].second;
        }

        return result;
    }

    std::string request::host() const
    {
        const auto &all = headers();
        if (auto it = all.find(web::headers::HOST); it != all.end())
            return it->second.substr(0, it->second.find(':'));
        if (connection_scope.server)
            return connection_scope.server->host;
        return {};
    }

    int request::port() const
    {
        if (connection_scope.server)
            return connection_scope.server->port;
        return (connection_scope.scheme == "https" || connection_scope.scheme == "wss") ? 443 : 80;
    }

    std::string request::path() const
    {
        return connection_scope.root_path + connection_scope.path;
    }

    const query_list &request::querylist() const
    {
        if (!query_cache)
            query_cache = core::parse_query(connection_scope.query_string);
        return *query_cache;
    }

    query_dict request::querydict() const
    {
        return core::to_query_dict(querylist());
    }

    http_request &request::as_http()
    {
        if (auto *http = dynamic_cast<http_request *>(this))
            return *http;
        throw protocol_state_error(fmt::format("Expected an http request, got a {} request.", to_string(kind())));
    }

    websocket_request &request::as_websocket()
    {
        if (auto *ws = dynamic_cast<websocket_request *>(this))
            return *ws;
        throw protocol_state_error(fmt::format("Expected a websocket request, got a {} request.", to_string(kind())));
    }

    http_request::http_request(web::scope s, channel &io, std::size_t body_limit)
        : request(std::move(s), io), limit(body_limit)
    {
    }

    async::async_generator<bytes> http_request::iter_body()
    {
        if (body_consumed)
            co_return;
        body_consumed = true;

        while (true)
        {
            auto event = co_await io.receive();

            if (auto *part = std::get_if<events::http_request>(&event))
            {
                bool more = part->more_body;
                co_yield std::move(part->body);
                if (!more)
                    co_return;
            }
            else if (std::holds_alternative<events::http_disconnect>(event))
            {
                client_gone = true;
                current = connection_state::closed;
                co_return;
            }
        }
    }

    async_t(bytes) http_request::get_body()
    {
        return get_body(limit);
    }

    async_t(bytes) http_request::get_body(std::size_t max_size)
    {
        if (body_cache)
            co_return *body_cache;
        if (body_consumed)
            throw protocol_state_error("Request body was already consumed.");

        auto chunks = iter_body();
        auto data = co_await assemble_body(chunks, max_size);

        if (client_gone)
            throw peer_disconnected("Client disconnected before the request body was complete.");

        body_cache = data;
        co_return data;
    }

    async_t(nlohmann::json) http_request::get_json()
    {
        return get_json(limit);
    }

    async_t(nlohmann::json) http_request::get_json(std::size_t max_size)
    {
        auto data = co_await get_body(max_size);
        co_return decode_json(data);
    }

    async_t(void) http_request::wait_for_disconnect()
    {
        body_consumed = true;

        while (!client_gone)
        {
            auto event = co_await io.receive();
            if (std::holds_alternative<events::http_disconnect>(event))
            {
                client_gone = true;
                current = connection_state::closed;
            }
        }
    }

    async_t(void) http_request::accept(int status, header_map headers)
    {
        if (client_gone)
            throw peer_disconnected("Client disconnected.");
        if (current != connection_state::init)
            throw protocol_state_error(fmt::format("Cannot accept a request that is already {}.", to_string(current)));

        validate_status(status);
        validate_headers(headers);

        outbound_event start = events::http_response_start{status, core::to_header_list(headers)};
        co_await io.send(std::move(start));
        current = connection_state::accepted;
    }

    async_t(void) http_request::accept(int status)
    {
        return accept(status, header_map{});
    }

    async_t(void) http_request::send(chunk data, bool more)
    {
        if (client_gone)
            throw peer_disconnected("Client disconnected.");
        if (current == connection_state::closed)
            throw protocol_state_error("Cannot send to a closed stream.");

        if (current == connection_state::init)
            co_await accept();

        outbound_event part = events::http_response_body{encode_chunk(std::move(data)), more};
        co_await io.send(std::move(part));
        current = more ? connection_state::streaming : connection_state::closed;
    }
}
