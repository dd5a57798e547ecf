///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <bridgecraft/async/async.hpp>
#include <bridgecraft/web/config.hpp>
#include <bridgecraft/web/diagnostics.hpp>
#include <bridgecraft/web/events.hpp>
#include <bridgecraft/web/request.hpp>
#include <bridgecraft/web/response.hpp>

namespace bridgecraft::web
{
    /// @brief User code for one request. Returns a response, or nothing after responding through the request.
    using handler = std::function<async_t(handler_result)(request &)>;

    using lifespan_hook = std::function<async_t(void)()>;

    /// @brief Adapts a handler to the host boundary.
    /// @details Called once per connection with the scope and channel of that connection.
    /// Handles http, websocket and lifespan scopes. Never lets an exception reach the host:
    /// failures are answered where the protocol state still allows it and always reported
    /// to the diagnostic sink.
    class application
    {
    public:
        explicit application(handler h, application_config config = {}, std::shared_ptr<diagnostic_sink> sink = nullptr);

        async_t(void) operator()(web::scope s, channel &io) const;

        application &on_startup(lifespan_hook hook);
        application &on_shutdown(lifespan_hook hook);

        const application_config &config() const noexcept { return settings; }
        const std::shared_ptr<diagnostic_sink> &sink() const noexcept { return diagnostics; }

    private:
        async_t(void) handle_http(web::scope s, channel &io) const;
        async_t(void) handle_websocket(web::scope s, channel &io) const;
        async_t(void) handle_lifespan(channel &io) const;

        async_t(void) recover_http(http_request &req, std::exception_ptr failure, std::string_view where) const;
        async_t(std::optional<std::string>) run_hook(const lifespan_hook &hook, std::string_view where) const;

        void report_cleanup_failure(std::exception_ptr failure, std::string_view where) const;

        handler app_handler;
        application_config settings;
        std::shared_ptr<diagnostic_sink> diagnostics;
        lifespan_hook startup_hook;
        lifespan_hook shutdown_hook;
    };

    application to_application(handler h);
}
