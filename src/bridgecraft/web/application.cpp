///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#include <stdexcept>
#include <fmt/format.h>
#include <bridgecraft/web/application.hpp>
#include <bridgecraft/web/connection.hpp>
#include <bridgecraft/web/errors.hpp>
#include <bridgecraft/web/failure_policy.hpp>

namespace bridgecraft::web
{
    namespace
    {
        constexpr std::string_view event_name(const inbound_event &event) noexcept
        {
            constexpr std::string_view names[] = {
                "http.request",
                "http.disconnect",
                "websocket.connect",
                "websocket.receive",
                "websocket.disconnect",
                "lifespan.startup",
                "lifespan.shutdown",
            };
            return names[event.index()];
        }
    }

    application::application(handler h, application_config config, std::shared_ptr<diagnostic_sink> sink)
        : app_handler(std::move(h)), settings(std::move(config)), diagnostics(std::move(sink))
    {
        if (!app_handler)
            throw std::invalid_argument("bridgecraft::web::application requires a handler.");
        if (!diagnostics)
            diagnostics = make_stderr_sink(settings.logger_name);
    }

    application &application::on_startup(lifespan_hook hook)
    {
        startup_hook = std::move(hook);
        return *this;
    }

    application &application::on_shutdown(lifespan_hook hook)
    {
        shutdown_hook = std::move(hook);
        return *this;
    }

    async_t(void) application::operator()(web::scope s, channel &io) const
    {
        switch (s.type)
        {
        case protocol_kind::http:
            co_await handle_http(std::move(s), io);
            break;
        case protocol_kind::websocket:
            co_await handle_websocket(std::move(s), io);
            break;
        case protocol_kind::lifespan:
            co_await handle_lifespan(io);
            break;
        }
    }

    async_t(void) application::handle_http(web::scope s, channel &io) const
    {
        http_request req(std::move(s), io, settings.body_limit);
        std::string_view where = "request handler";
        std::exception_ptr failure;

        try
        {
            auto result = co_await app_handler(req);

            if (req.state() == connection_state::init)
            {
                where = "processing handler output";
                auto res = normalize_response(std::move(result));

                if (res.body.is_stream())
                {
                    where = "sending chunked response";
                    co_await stream_response(req, res.status, std::move(res.headers), std::move(res.body.get<chunk_sequence>()));
                }
                else
                {
                    auto encoded = encode_body(res.body);
                    where = "sending response";
                    co_await write_response(req, res.status, std::move(res.headers), std::move(encoded), settings.set_content_length);
                }
            }
            else if (!result.empty() && !req.disconnected())
            {
                // closed by a client disconnect is not an accept
                diagnostics->emit(severity::warning, "UsageError in request handler: Handlers that call request.accept() should return None.");
            }

            if (is_open(req.state()))
            {
                where = "finalizing response";
                co_await finish_response(req);
            }
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        if (failure)
            co_await recover_http(req, failure, where);
    }

    async_t(void) application::recover_http(http_request &req, std::exception_ptr failure, std::string_view where) const
    {
        auto report = classify_failure(failure, where, settings.expose_error_details);
        diagnostics->emit(report.level, report.log_text);

        if (report.kind == failure_kind::disconnect || req.disconnected())
            co_return;

        std::exception_ptr cleanup_failure;
        try
        {
            if (req.state() == connection_state::init)
            {
                header_map headers{{std::string{web::headers::CONTENT_TYPE}, std::string{content_types::TEXT_PLAIN}}};
                encoded_body body{bytes(report.body_text.begin(), report.body_text.end()), {}};
                co_await write_response(req, report.status, std::move(headers), std::move(body), settings.set_content_length);
            }
            else
            {
                // headers are on the wire, at least end the body
                co_await finish_response(req);
            }
        }
        catch (...)
        {
            cleanup_failure = std::current_exception();
        }

        if (cleanup_failure)
            report_cleanup_failure(cleanup_failure, "error recovery");
    }

    async_t(void) application::handle_websocket(web::scope s, channel &io) const
    {
        websocket_request req(std::move(s), io);
        std::exception_ptr failure;

        try
        {
            auto result = co_await app_handler(req);
            if (!result.empty())
            {
                diagnostics->emit(severity::warning,
                                  "UsageError in websocket handler: A websocket handler should return None; "
                                  "use request.send() and request.receive() to communicate.");
            }
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        if (failure)
        {
            auto report = classify_failure(failure, "websocket handler", settings.expose_error_details);
            diagnostics->emit(report.level, report.log_text);
        }

        if (!settings.close_websocket_on_return || req.state() == connection_state::closed)
            co_return;

        std::exception_ptr cleanup_failure;
        try
        {
            co_await finish_websocket(req);
        }
        catch (...)
        {
            cleanup_failure = std::current_exception();
        }

        if (cleanup_failure)
            report_cleanup_failure(cleanup_failure, "closing websocket");
    }

    async_t(std::optional<std::string>) application::run_hook(const lifespan_hook &hook, std::string_view where) const
    {
        if (!hook)
            co_return std::nullopt;

        std::exception_ptr failure;
        try
        {
            co_await hook();
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        if (!failure)
            co_return std::nullopt;

        auto report = classify_failure(failure, where, settings.expose_error_details);
        diagnostics->emit(severity::error, report.log_text);
        co_return report.message;
    }

    async_t(void) application::handle_lifespan(channel &io) const
    {
        std::exception_ptr failure;

        try
        {
            while (true)
            {
                auto event = co_await io.receive();

                if (std::holds_alternative<events::lifespan_startup>(event))
                {
                    diagnostics->emit(severity::info, "Server is starting up");
                    outbound_event reply = events::lifespan_startup_complete{};
                    if (auto message = co_await run_hook(startup_hook, "startup hook"))
                        reply = events::lifespan_startup_failed{std::move(*message)};
                    co_await io.send(std::move(reply));
                }
                else if (std::holds_alternative<events::lifespan_shutdown>(event))
                {
                    diagnostics->emit(severity::info, "Server is shutting down");
                    outbound_event reply = events::lifespan_shutdown_complete{};
                    if (auto message = co_await run_hook(shutdown_hook, "shutdown hook"))
                        reply = events::lifespan_shutdown_failed{std::move(*message)};
                    co_await io.send(std::move(reply));
                    co_return;
                }
                else
                {
                    diagnostics->emit(severity::warning, fmt::format("Unknown lifespan message {}", event_name(event)));
                }
            }
        }
        catch (...)
        {
            failure = std::current_exception();
        }

        if (failure)
        {
            auto report = classify_failure(failure, "lifespan", settings.expose_error_details);
            diagnostics->emit(report.level, report.log_text);
        }
    }

    void application::report_cleanup_failure(std::exception_ptr failure, std::string_view where) const
    {
        auto report = classify_failure(failure, where, settings.expose_error_details);
        diagnostics->emit(severity::debug, report.log_text);
    }

    application to_application(handler h)
    {
        return application(std::move(h));
    }
}
