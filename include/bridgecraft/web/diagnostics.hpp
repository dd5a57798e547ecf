///////////////////////////////////////////////////////////////////////////////
// Copyright (c) Aditya Rao
// Licenced under MIT license. See LICENSE.txt for details.
///////////////////////////////////////////////////////////////////////////////

#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <spdlog/logger.h>

namespace bridgecraft::web
{
    enum class severity
    {
        debug,
        info,
        warning,
        error
    };

    constexpr std::string_view to_string(severity level) noexcept
    {
        switch (level)
        {
        case severity::debug:
            return "debug";
        case severity::info:
            return "info";
        case severity::warning:
            return "warning";
        case severity::error:
            return "error";
        }
        return "unknown";
    }

    /// @brief Where the application reports failures. Injected into the application.
    class diagnostic_sink
    {
    public:
        virtual ~diagnostic_sink() = default;

        virtual void emit(severity level, std::string_view message) noexcept = 0;
    };

    /// @brief Forwards diagnostics to an spdlog logger.
    class spdlog_sink : public diagnostic_sink
    {
    public:
        explicit spdlog_sink(std::shared_ptr<spdlog::logger> logger);

        void emit(severity level, std::string_view message) noexcept override;

        const std::shared_ptr<spdlog::logger> &logger() const noexcept { return target; }

    private:
        std::shared_ptr<spdlog::logger> target;
    };

    /// @brief Sink over a colored stderr logger registered under `name`.
    /// @details An already registered logger with that name is reused as is.
    std::shared_ptr<diagnostic_sink> make_stderr_sink(const std::string &name = "bridgecraft");
}
